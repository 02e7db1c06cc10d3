#pragma once

#include "seocrawler/Fetcher.h"
#include "seocrawler/RobotsDirectives.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace seocrawler {

	//depth of sitemap-only entries that no BFS visit reached
	constexpr int SITEMAP_DEPTH = 9999;

	struct CrawlRequest {
		std::string startUrl;
		//unset fields take the configured defaults
		std::optional<int> depth;
		std::optional<int> maxPages;
		bool includeSubdomains = false;
		std::optional<std::string> userAgent;
		std::optional<bool> respectRobots;
	};

	enum class DiscoveredBy { Html, Sitemap, Both };

	//provenance only ever moves towards Both
	inline DiscoveredBy strengthen(DiscoveredBy current, DiscoveredBy seen) {
		return current == seen ? current : DiscoveredBy::Both;
	}

	const char* toString(DiscoveredBy discoveredBy);

	struct InventoryItem {
		std::string url;
		std::string normalizedUrl;
		std::string finalUrl;
		//0 while never fetched
		int status = 0;
		std::optional<std::string> contentType;
		int depth = SITEMAP_DEPTH;
		DiscoveredBy discoveredBy = DiscoveredBy::Html;
		RedirectChain redirectChain;
	};

	//one internal <a href>, both ends normalized keys
	struct Edge {
		std::string from;
		std::string to;
	};

	struct CrawlStats {
		int pagesFetched = 0;
		int pagesFromSitemap = 0;
		int pagesFromHtml = 0;
		int64_t elapsedMs = 0;
	};

	struct StatusBuckets {
		int unfetched = 0; //"0xx"
		int success = 0; //"2xx"
		int redirect = 0; //"3xx"
		int clientError = 0; //"4xx"
		int serverError = 0; //"5xx"

		void add(int status);
	};

	struct CrawlReports {
		std::vector<std::string> orphansInSitemap;
		std::vector<std::string> linkedNotInSitemap;
		StatusBuckets statusBuckets;
	};

	struct CrawlResult {
		std::vector<InventoryItem> inventory;
		std::vector<Edge> edges;
		//sitemap endpoints consulted, not their urls
		std::vector<std::string> sitemap;
		CrawlStats stats;
		CrawlReports reports;
	};

	struct AuditRequest {
		std::vector<std::string> urls;
		std::optional<std::string> userAgent;
	};

	struct HreflangLink {
		std::string lang;
		std::string href;
	};

	struct AuditResult {
		std::string url;
		std::string finalUrl;
		int status = 0;
		std::optional<std::string> contentType;
		//absolute canonical, nullopt when missing or unusable
		std::optional<std::string> canonical;
		std::optional<RobotsDirectives> metaRobots;
		std::optional<RobotsDirectives> xRobots;
		bool noindexMeta = false;
		bool noindexHeader = false;
		std::vector<HreflangLink> hreflang;
		std::vector<std::string> issues;
		RedirectChain redirectChain;
	};

	namespace issues {
		constexpr const char* FETCH_FAILED = "fetch failed";
		constexpr const char* MULTIPLE_CANONICALS = "multiple canonicals";
		constexpr const char* CONFLICTING_NOINDEX = "conflicting noindex between meta and header";
		constexpr const char* CANONICAL_OTHER_DOMAIN = "canonical points to different eTLD+1";
		constexpr const char* INVALID_CANONICAL = "invalid canonical URL";
	}

}
