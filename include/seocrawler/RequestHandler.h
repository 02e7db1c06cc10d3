#pragma once

#include "seocrawler/Crawler.h"
#include "seocrawler/IndexabilityAuditor.h"
#include "seocrawler/JsonCodec.h"

#include <optional>
#include <string>

namespace seocrawler {

	//maps one websocket text message to its reply; every failure becomes {"ok":false,"error":...}
	class RequestHandler {
	public:
		//empty snapshotDir disables snapshots
		RequestHandler(Crawler& crawler, IndexabilityAuditor& auditor, std::string snapshotDir);

		std::string handle(const std::string& message);

		json dispatch(const json& message);

	private:
		json crawl(const json& params);
		json audit(const json& params);

		std::optional<std::string> writeSnapshot(const CrawlRequest& request, const json& output) const;

		Crawler& m_crawler;
		IndexabilityAuditor& m_auditor;
		std::string m_snapshotDir;
	};

}
