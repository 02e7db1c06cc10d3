#include "seocrawler/JsonCodec.h"

#include "seocrawler/Errors.h"
#include "seocrawler/IndexabilityAuditor.h"
#include "seocrawler/Link.h"

namespace seocrawler {

	namespace {

		constexpr int MAX_DEPTH = 6;
		constexpr int MAX_PAGES = 5000;

		const json& requireObject(const json& params) {
			if (!params.is_object())
				throw InvalidRequest("params must be an object");
			return params;
		}

		std::optional<std::string> optionalString(const json& params, const char* key) {
			auto it = params.find(key);
			if (it == params.end() || it->is_null())
				return std::nullopt;
			if (!it->is_string())
				throw InvalidRequest(std::string(key) + " must be a string");
			return it->get<std::string>();
		}

		std::optional<bool> optionalBool(const json& params, const char* key) {
			auto it = params.find(key);
			if (it == params.end() || it->is_null())
				return std::nullopt;
			if (!it->is_boolean())
				throw InvalidRequest(std::string(key) + " must be a boolean");
			return it->get<bool>();
		}

		std::optional<int> optionalInt(const json& params, const char* key, int minimum, int maximum) {
			auto it = params.find(key);
			if (it == params.end() || it->is_null())
				return std::nullopt;
			if (!it->is_number_integer())
				throw InvalidRequest(std::string(key) + " must be an integer");
			auto value = it->get<int64_t>();
			if (value < minimum || value > maximum)
				throw InvalidRequest(std::string(key) + " must be between " + std::to_string(minimum) + " and "
					+ std::to_string(maximum));
			return static_cast<int>(value);
		}

		void requireUrl(const std::string& value, const char* field, bool httpOnly) {
			auto link = Link::parse(value);
			if (!link || (httpOnly && !link->isHttp()))
				throw InvalidRequest(std::string(field) + " is not a valid url: " + value);
		}

		json optionalToJson(const std::optional<std::string>& value) {
			return value ? json(*value) : json(nullptr);
		}

	}

	CrawlRequest parseCrawlRequest(const json& params) {
		requireObject(params);

		CrawlRequest request;
		auto startUrl = optionalString(params, "startUrl");
		if (!startUrl)
			throw InvalidRequest("startUrl is required");
		requireUrl(*startUrl, "startUrl", true);
		request.startUrl = *startUrl;

		request.depth = optionalInt(params, "depth", 0, MAX_DEPTH);
		request.maxPages = optionalInt(params, "maxPages", 1, MAX_PAGES);
		request.includeSubdomains = optionalBool(params, "includeSubdomains").value_or(false);
		request.userAgent = optionalString(params, "userAgent");
		request.respectRobots = optionalBool(params, "respectRobots");
		return request;
	}

	AuditRequest parseAuditRequest(const json& params) {
		requireObject(params);

		auto urls = params.find("urls");
		if (urls == params.end() || !urls->is_array())
			throw InvalidRequest("urls must be an array");
		if (urls->empty() || urls->size() > IndexabilityAuditor::MAX_URLS)
			throw InvalidRequest("urls must hold between 1 and " + std::to_string(IndexabilityAuditor::MAX_URLS) + " entries");

		AuditRequest request;
		for (const auto& url : *urls) {
			if (!url.is_string())
				throw InvalidRequest("urls must hold strings");
			requireUrl(url.get<std::string>(), "urls[]", false);
			request.urls.push_back(url.get<std::string>());
		}
		request.userAgent = optionalString(params, "userAgent");
		return request;
	}

	json toJson(const CrawlRequest& request) {
		json j;
		j["startUrl"] = request.startUrl;
		if (request.depth)
			j["depth"] = *request.depth;
		if (request.maxPages)
			j["maxPages"] = *request.maxPages;
		j["includeSubdomains"] = request.includeSubdomains;
		if (request.userAgent)
			j["userAgent"] = *request.userAgent;
		if (request.respectRobots)
			j["respectRobots"] = *request.respectRobots;
		return j;
	}

	void to_json(json& j, const RedirectHop& hop) {
		j = json{ { "from", hop.from }, { "to", hop.to }, { "status", hop.status } };
	}

	void to_json(json& j, const InventoryItem& item) {
		j = json{
			{ "url", item.url },
			{ "normalizedUrl", item.normalizedUrl },
			{ "finalUrl", item.finalUrl },
			{ "status", item.status },
			{ "contentType", optionalToJson(item.contentType) },
			{ "depth", item.depth },
			{ "discoveredBy", toString(item.discoveredBy) },
			{ "redirectChain", item.redirectChain },
		};
	}

	void to_json(json& j, const Edge& edge) {
		j = json{ { "from", edge.from }, { "to", edge.to } };
	}

	void to_json(json& j, const CrawlStats& stats) {
		j = json{
			{ "pagesFetched", stats.pagesFetched },
			{ "pagesFromSitemap", stats.pagesFromSitemap },
			{ "pagesFromHtml", stats.pagesFromHtml },
			{ "elapsedMs", stats.elapsedMs },
		};
	}

	void to_json(json& j, const StatusBuckets& buckets) {
		j = json{
			{ "0xx", buckets.unfetched },
			{ "2xx", buckets.success },
			{ "3xx", buckets.redirect },
			{ "4xx", buckets.clientError },
			{ "5xx", buckets.serverError },
		};
	}

	void to_json(json& j, const CrawlReports& reports) {
		j = json{
			{ "orphansInSitemap", reports.orphansInSitemap },
			{ "linkedNotInSitemap", reports.linkedNotInSitemap },
			{ "statusBuckets", reports.statusBuckets },
		};
	}

	void to_json(json& j, const CrawlResult& result) {
		j = json{
			{ "inventory", result.inventory },
			{ "edges", result.edges },
			{ "sitemap", result.sitemap },
			{ "stats", result.stats },
			{ "reports", result.reports },
		};
	}

	void to_json(json& j, const RobotsDirectives& directives) {
		j = json::object();
		auto put = [&j](const char* key, const std::optional<bool>& value) {
			if (value)
				j[key] = *value;
		};
		put("noindex", directives.noindex);
		put("nofollow", directives.nofollow);
		put("noarchive", directives.noarchive);
		put("nosnippet", directives.nosnippet);
		put("noimageindex", directives.noimageindex);
		put("nocache", directives.nocache);
	}

	void to_json(json& j, const HreflangLink& link) {
		j = json{ { "lang", link.lang }, { "href", link.href } };
	}

	void to_json(json& j, const AuditResult& result) {
		j = json{
			{ "url", result.url },
			{ "finalUrl", result.finalUrl },
			{ "status", result.status },
			{ "contentType", optionalToJson(result.contentType) },
			{ "canonical", optionalToJson(result.canonical) },
			{ "noindex", { { "meta", result.noindexMeta }, { "header", result.noindexHeader } } },
			{ "hreflang", result.hreflang },
			{ "issues", result.issues },
			{ "redirectChain", result.redirectChain },
		};
		if (result.metaRobots)
			j["metaRobots"] = *result.metaRobots;
		if (result.xRobots)
			j["xRobots"] = *result.xRobots;
	}

}
