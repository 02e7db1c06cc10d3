#pragma once

#include "seocrawler/Config.h"
#include "seocrawler/Fetcher.h"
#include "seocrawler/HttpTransport.h"
#include "seocrawler/Robots.h"
#include "seocrawler/Sitemap.h"
#include "seocrawler/ThreadPool.h"
#include "seocrawler/Types.h"
#include "seocrawler/UrlCanonicalizer.h"

#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

namespace seocrawler {

	//breadth-first crawl of one site merged with its sitemaps.
	//every crawl() owns its traversal state; only the robots cache outlives a call
	class Crawler {
	public:
		Crawler(HttpTransport& transport, Config config, UrlCanonicalizer canonicalizer);

		//throws InvalidRequest for an unusable start url or negative budgets, nothing else
		CrawlResult crawl(const CrawlRequest& request);

	private:
		struct Node {
			std::string url;
			int depth = 0;
		};

		struct State;

		void runFrontier(State& state);
		void visit(State& state, const Node& node);
		void recordLinks(State& state, const Node& node, const std::string& key, const FetchResult& result);
		void resolveLinkedSitemapUrls(State& state);
		std::shared_ptr<const RobotsAgent> robotsFor(const State& state, const Link& link);

		static CrawlReports buildReports(const std::unordered_set<std::string>& fromSitemap, const std::vector<Edge>& edges,
			const std::vector<InventoryItem>& inventory);

		Config m_config;
		UrlCanonicalizer m_canonicalizer;
		Fetcher m_fetcher;
		RobotsPolicyProvider m_robots;
		SitemapResolver m_sitemaps;
		ThreadPool m_pool;
	};

}
