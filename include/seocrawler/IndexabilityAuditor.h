#pragma once

#include "seocrawler/Config.h"
#include "seocrawler/Fetcher.h"
#include "seocrawler/ThreadPool.h"
#include "seocrawler/Types.h"

#include <string>
#include <vector>

namespace seocrawler {

	//canonical, robots directives and hreflang of a list of urls, each audited on its own
	class IndexabilityAuditor {
	public:
		static constexpr size_t MAX_URLS = 200;

		IndexabilityAuditor(HttpTransport& transport, Config config);

		//results in input order; throws InvalidRequest for an empty or oversized list
		std::vector<AuditResult> audit(const AuditRequest& request);

		//never throws, an unreachable url comes back with status 0 and "fetch failed"
		AuditResult auditUrl(const std::string& url, const std::string& userAgent) const;

	private:
		Config m_config;
		Fetcher m_fetcher;
		ThreadPool m_pool;
	};

}
