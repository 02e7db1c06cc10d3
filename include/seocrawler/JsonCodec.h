#pragma once

#include "seocrawler/Types.h"

#include <nlohmann/json.hpp>

namespace seocrawler {

	using json = nlohmann::json;

	//validated request decoding, throws InvalidRequest with a field specific message
	CrawlRequest parseCrawlRequest(const json& params);
	AuditRequest parseAuditRequest(const json& params);

	//echo of a request as stored in snapshots
	json toJson(const CrawlRequest& request);

	//serializers found by nlohmann through adl
	void to_json(json& j, const RedirectHop& hop);
	void to_json(json& j, const InventoryItem& item);
	void to_json(json& j, const Edge& edge);
	void to_json(json& j, const CrawlStats& stats);
	void to_json(json& j, const StatusBuckets& buckets);
	void to_json(json& j, const CrawlReports& reports);
	void to_json(json& j, const CrawlResult& result);
	//asserted keys only
	void to_json(json& j, const RobotsDirectives& directives);
	void to_json(json& j, const HreflangLink& link);
	void to_json(json& j, const AuditResult& result);

}
