#include "seocrawler/Crawler.h"

#include "seocrawler/Errors.h"
#include "seocrawler/HtmlSignals.h"
#include "seocrawler/Log.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <deque>
#include <mutex>
#include <set>
#include <thread>
#include <unordered_map>

namespace seocrawler {

	//traversal state of one crawl() call; everything below mutex is shared by the workers
	struct Crawler::State {
		explicit State(Link startLink) : base(std::move(startLink)) {}

		const Link base;
		int maxDepth = 0;
		int maxPages = 0;
		bool includeSubdomains = false;
		bool respectRobots = false;
		std::string userAgent;
		std::shared_ptr<const RobotsAgent> startRobots;
		//filled before the frontier runs, read-only afterwards
		std::unordered_set<std::string> fromSitemap;

		std::mutex mutex;
		std::deque<Node> queue;
		std::unordered_set<std::string> seen;
		std::unordered_map<std::string, InventoryItem> inventory;
		std::vector<Edge> edges;
		int fetched = 0;
		//fetches started but not finished, they hold a slot of the page budget
		int inFlight = 0;

		//call with mutex held
		bool hasBudget() const { return fetched + inFlight < maxPages; }
	};

	namespace {

		bool isHtml(const HttpResponse& response) {
			auto contentType = response.contentType();
			if (!contentType)
				return false;
			std::string lower = *contentType;
			std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
			return lower.find("text/html") != std::string::npos;
		}

	}

	Crawler::Crawler(HttpTransport& transport, Config config, UrlCanonicalizer canonicalizer)
		: m_config(std::move(config)),
		  m_canonicalizer(std::move(canonicalizer)),
		  m_fetcher(transport, m_config.fetchOptions()),
		  m_robots(m_fetcher),
		  m_sitemaps(m_fetcher),
		  m_pool(static_cast<size_t>(std::max(m_config.maxConcurrency, 1))) {
	}

	CrawlResult Crawler::crawl(const CrawlRequest& request) {
		auto started = std::chrono::steady_clock::now();

		auto base = Link::parse(request.startUrl);
		if (!base || !base->isHttp() || base->getHost().empty())
			throw InvalidRequest("Invalid start url: " + request.startUrl);

		State state(*base);
		state.maxDepth = request.depth.value_or(m_config.defaultDepth);
		state.maxPages = request.maxPages.value_or(m_config.maxPages);
		if (state.maxDepth < 0)
			throw InvalidRequest("depth must not be negative");
		if (state.maxPages < 0)
			throw InvalidRequest("maxPages must not be negative");

		state.includeSubdomains = request.includeSubdomains;
		state.userAgent = request.userAgent && !request.userAgent->empty() ? *request.userAgent : m_config.userAgent;
		state.respectRobots = request.respectRobots.value_or(m_config.respectRobots);
		state.startRobots = state.respectRobots ? m_robots.getAgent(base->getOrigin(), state.userAgent)
			: RobotsAgent::allowAll();

		const std::string startUrl = base->getFullLink();
		const auto counterpart = UrlCanonicalizer::wwwCounterpart(startUrl);
		log::info("Crawling ", startUrl, " (depth ", state.maxDepth, ", max pages ", state.maxPages, ")");

		//sitemap endpoints of the start host and of its www / non-www sibling
		CrawlResult result;
		result.sitemap = SitemapResolver::discoverSitemapEndpoints(startUrl, state.startRobots->getSitemaps());
		if (counterpart) {
			for (const auto& endpoint : SitemapResolver::discoverSitemapEndpoints(*counterpart, {})) {
				if (std::find(result.sitemap.begin(), result.sitemap.end(), endpoint) == result.sitemap.end())
					result.sitemap.push_back(endpoint);
			}
		}

		for (const auto& endpoint : result.sitemap) {
			size_t collected = state.fromSitemap.size();
			if (collected >= static_cast<size_t>(state.maxPages))
				break;
			for (const auto& url : m_sitemaps.collectSitemapUrls(endpoint, state.userAgent, state.maxPages - collected))
				state.fromSitemap.insert(UrlCanonicalizer::normalizeForKey(url));
		}
		log::info("Sitemaps list ", state.fromSitemap.size(), " urls for ", startUrl);

		state.queue.push_back({ startUrl, 0 });
		if (counterpart)
			state.queue.push_back({ *counterpart, 0 });

		for (const auto& key : state.fromSitemap) {
			auto it = state.inventory.find(key);
			if (it != state.inventory.end()) {
				it->second.discoveredBy = strengthen(it->second.discoveredBy, DiscoveredBy::Sitemap);
				continue;
			}
			InventoryItem item;
			item.url = key;
			item.normalizedUrl = key;
			item.finalUrl = key;
			item.depth = SITEMAP_DEPTH;
			item.discoveredBy = DiscoveredBy::Sitemap;
			state.inventory.emplace(key, std::move(item));
		}

		runFrontier(state);
		resolveLinkedSitemapUrls(state);

		result.inventory.reserve(state.inventory.size());
		for (auto& entry : state.inventory)
			result.inventory.push_back(std::move(entry.second));
		std::sort(result.inventory.begin(), result.inventory.end(), [](const InventoryItem& a, const InventoryItem& b) {
			if (a.depth != b.depth)
				return a.depth < b.depth;
			return a.normalizedUrl < b.normalizedUrl;
		});
		result.edges = std::move(state.edges);
		result.reports = buildReports(state.fromSitemap, result.edges, result.inventory);

		result.stats.pagesFetched = state.fetched;
		result.stats.pagesFromSitemap = static_cast<int>(state.fromSitemap.size());
		result.stats.pagesFromHtml = static_cast<int>(std::count_if(result.inventory.begin(), result.inventory.end(),
			[](const InventoryItem& item) { return item.discoveredBy != DiscoveredBy::Sitemap; }));
		result.stats.elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
			std::chrono::steady_clock::now() - started).count();

		log::info("Crawl of ", startUrl, " finished: ", result.stats.pagesFetched, " pages fetched, ",
			result.inventory.size(), " urls, ", result.edges.size(), " edges in ", result.stats.elapsedMs, "ms");
		return result;
	}

	//fifo batches no larger than the pool, each batch completes before the next is taken
	void Crawler::runFrontier(State& state) {
		for (;;) {
			std::vector<Node> batch;
			{
				std::lock_guard<std::mutex> lock(state.mutex);
				if (state.queue.empty() || state.fetched >= state.maxPages)
					break;
				while (!state.queue.empty() && batch.size() < m_pool.size()) {
					batch.push_back(std::move(state.queue.front()));
					state.queue.pop_front();
				}
			}

			std::vector<std::future<void>> futures;
			futures.reserve(batch.size());
			for (const auto& node : batch)
				futures.push_back(m_pool.enqueue([this, &state, node] { visit(state, node); }));
			waitAll(futures);
		}
	}

	void Crawler::visit(State& state, const Node& node) {
		auto link = Link::parse(node.url);
		if (!link)
			return;

		const std::string key = UrlCanonicalizer::normalizeForKey(node.url);
		{
			std::lock_guard<std::mutex> lock(state.mutex);
			//every slot is held by a fetch still running; retry once the batch settles
			if (!state.hasBudget()) {
				state.queue.push_front(node);
				return;
			}
			//check and mark in one step so two workers never visit the same key
			if (!state.seen.insert(key).second)
				return;
		}

		if (!UrlCanonicalizer::isInternal(state.base, *link, state.includeSubdomains))
			return;
		if (m_canonicalizer.hasIgnoredExtension(*link))
			return;

		auto robots = robotsFor(state, *link);
		if (!robots->isAllowed(node.url)) {
			log::debug("Disallowed by robots.txt: ", node.url);
			return;
		}

		{
			std::lock_guard<std::mutex> lock(state.mutex);
			if (!state.hasBudget()) {
				state.seen.erase(key);
				state.queue.push_front(node);
				return;
			}
			++state.inFlight;
		}

		FetchResult result;
		try {
			result = m_fetcher.fetchChain(node.url, state.userAgent);
		}
		catch (const FetchError& ex) {
			std::lock_guard<std::mutex> lock(state.mutex);
			--state.inFlight;
			log::debug("Failed to crawl: ", node.url, " (", ex.what(), ")");
			return;
		}

		{
			std::lock_guard<std::mutex> lock(state.mutex);
			--state.inFlight;
			++state.fetched;

			InventoryItem item;
			item.url = node.url;
			item.normalizedUrl = key;
			item.finalUrl = result.finalUrl;
			item.status = result.response.statusCode;
			item.contentType = result.response.contentType();
			item.depth = node.depth;
			item.discoveredBy = state.fromSitemap.count(key) != 0 ? DiscoveredBy::Both : DiscoveredBy::Html;
			item.redirectChain = result.redirectChain;

			auto it = state.inventory.find(key);
			if (it == state.inventory.end()) {
				state.inventory.emplace(key, std::move(item));
			}
			else {
				DiscoveredBy previous = it->second.discoveredBy;
				it->second = std::move(item);
				it->second.discoveredBy = strengthen(previous, it->second.discoveredBy);
			}
		}
		log::debug("Crawled ", node.url, " -> ", result.response.statusCode, " at depth ", node.depth);

		recordLinks(state, node, key, result);

		//global politeness throttle, the batch waits for this worker
		if (auto delay = robots->getCrawlDelay(); delay && *delay > 0)
			std::this_thread::sleep_for(std::chrono::duration<double>(*delay));
	}

	void Crawler::recordLinks(State& state, const Node& node, const std::string& key, const FetchResult& result) {
		if (!result.response.ok() || !isHtml(result.response))
			return;

		auto finalLink = Link::parse(result.finalUrl);
		if (!finalLink)
			return;

		std::set<std::string> targets;
		for (const auto& href : extractHrefs(result.response.text)) {
			if (auto resolved = Link::resolve(*finalLink, href))
				targets.insert(resolved->getFullLink());
		}

		std::vector<Node> internal;
		std::vector<std::string> keys;
		for (const auto& target : targets) {
			auto targetLink = Link::parse(target);
			if (!targetLink)
				continue;
			if (!UrlCanonicalizer::isInternal(state.base, *targetLink, state.includeSubdomains))
				continue;
			if (m_canonicalizer.hasIgnoredExtension(*targetLink))
				continue;
			internal.push_back({ target, node.depth + 1 });
			keys.push_back(UrlCanonicalizer::normalizeForKey(target));
		}

		std::lock_guard<std::mutex> lock(state.mutex);
		for (size_t i = 0; i < internal.size(); ++i) {
			state.edges.push_back({ key, keys[i] });
			if (node.depth < state.maxDepth && state.seen.count(keys[i]) == 0)
				state.queue.push_back(std::move(internal[i]));
		}
	}

	//sitemap urls that html links to but the bfs never fetched get their real status
	void Crawler::resolveLinkedSitemapUrls(State& state) {
		std::vector<std::string> candidates;
		int room = 0;
		{
			std::lock_guard<std::mutex> lock(state.mutex);
			std::unordered_set<std::string> inbound;
			for (const auto& edge : state.edges)
				inbound.insert(edge.to);

			std::vector<std::string> ordered(state.fromSitemap.begin(), state.fromSitemap.end());
			std::sort(ordered.begin(), ordered.end());
			for (const auto& key : ordered) {
				auto it = state.inventory.find(key);
				if (inbound.count(key) != 0 && it != state.inventory.end() && it->second.status == 0)
					candidates.push_back(key);
			}
			room = std::max(0, state.maxPages - state.fetched);
		}

		if (state.respectRobots) {
			candidates.erase(std::remove_if(candidates.begin(), candidates.end(), [&](const std::string& key) {
				auto link = Link::parse(key);
				return link && !robotsFor(state, *link)->isAllowed(key);
			}), candidates.end());
		}

		if (candidates.size() > static_cast<size_t>(room))
			candidates.resize(static_cast<size_t>(room));
		if (candidates.empty())
			return;
		log::debug("Resolving ", candidates.size(), " linked sitemap urls");

		for (size_t offset = 0; offset < candidates.size(); offset += m_pool.size()) {
			size_t end = std::min(candidates.size(), offset + m_pool.size());
			std::vector<std::future<void>> futures;
			for (size_t i = offset; i < end; ++i) {
				futures.push_back(m_pool.enqueue([this, &state, key = candidates[i]] {
					FetchResult result;
					try {
						result = m_fetcher.fetchChain(key, state.userAgent);
					}
					catch (const FetchError& ex) {
						log::debug("Failed to resolve sitemap url ", key, ": ", ex.what());
						return;
					}

					std::lock_guard<std::mutex> lock(state.mutex);
					++state.fetched;
					InventoryItem& item = state.inventory[key];
					item.finalUrl = result.finalUrl;
					item.status = result.response.statusCode;
					item.contentType = result.response.contentType();
					item.depth = std::min(item.depth, state.maxDepth + 1);
					item.discoveredBy = DiscoveredBy::Both;
					item.redirectChain = result.redirectChain;
				}));
			}
			waitAll(futures);
		}
	}

	std::shared_ptr<const RobotsAgent> Crawler::robotsFor(const State& state, const Link& link) {
		if (!state.respectRobots)
			return RobotsAgent::allowAll();
		if (link.getOrigin() == state.base.getOrigin())
			return state.startRobots;
		return m_robots.getAgent(link.getOrigin(), state.userAgent);
	}

	CrawlReports Crawler::buildReports(const std::unordered_set<std::string>& fromSitemap, const std::vector<Edge>& edges,
		const std::vector<InventoryItem>& inventory) {
		std::set<std::string> inbound;
		for (const auto& edge : edges)
			inbound.insert(edge.to);

		CrawlReports reports;
		std::set<std::string> sitemapKeys(fromSitemap.begin(), fromSitemap.end());
		for (const auto& key : sitemapKeys) {
			if (inbound.count(key) == 0)
				reports.orphansInSitemap.push_back(key);
		}
		for (const auto& key : inbound) {
			if (sitemapKeys.count(key) == 0)
				reports.linkedNotInSitemap.push_back(key);
		}
		for (const auto& item : inventory)
			reports.statusBuckets.add(item.status);
		return reports;
	}

}
