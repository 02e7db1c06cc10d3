#pragma once

#include "seocrawler/Fetcher.h"

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace seocrawler {

	struct SitemapDocument {
		//true for <sitemapindex>, locations are then child sitemaps
		bool isIndex = false;
		std::vector<std::string> locations;
	};

	class SitemapResolver {
	public:
		explicit SitemapResolver(const Fetcher& fetcher) : m_fetcher(fetcher) {}

		//robots-declared endpoints plus the /sitemap.xml guess on the start origin
		static std::vector<std::string> discoverSitemapEndpoints(const std::string& startUrl,
			const std::vector<std::string>& robotsSitemaps);

		//flat page urls behind an endpoint, at most limit of them; failures yield nothing
		std::vector<std::string> collectSitemapUrls(const std::string& endpoint, const std::string& userAgent,
			size_t limit) const;

		//nullopt for malformed xml or a document that is neither urlset nor sitemapindex
		static std::optional<SitemapDocument> parse(const std::string& xml);

	private:
		std::vector<std::string> collect(const std::string& endpoint, const std::string& userAgent, size_t remaining,
			std::unordered_set<std::string>& expanded) const;

		const Fetcher& m_fetcher;
	};

}
