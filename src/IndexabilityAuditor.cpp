#include "seocrawler/IndexabilityAuditor.h"

#include "seocrawler/Errors.h"
#include "seocrawler/HtmlSignals.h"
#include "seocrawler/Link.h"
#include "seocrawler/Log.h"
#include "seocrawler/UrlCanonicalizer.h"

#include <algorithm>
#include <cctype>
#include <future>

namespace seocrawler {

	namespace {

		std::string trim(const std::string& value) {
			size_t start = value.find_first_not_of(" \t\r\n\f");
			if (start == std::string::npos)
				return "";
			size_t end = value.find_last_not_of(" \t\r\n\f");
			return value.substr(start, end - start + 1);
		}

		bool isHtml(const std::optional<std::string>& contentType) {
			if (!contentType)
				return false;
			std::string lower = *contentType;
			std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
			return lower.find("text/html") != std::string::npos;
		}

		//returns the first non-empty canonical href, resolution is left to the caller
		std::optional<std::string> applyHtmlSignals(AuditResult& result, const Link& page, const std::string& html) {
			HtmlSignals signals = extractHtmlSignals(html);

			std::optional<std::string> canonicalHref;
			if (signals.canonicalHrefs.size() > 1)
				result.issues.push_back(issues::MULTIPLE_CANONICALS);
			if (!signals.canonicalHrefs.empty()) {
				std::string href = trim(signals.canonicalHrefs.front());
				if (!href.empty())
					canonicalHref = href;
			}

			for (const auto& [rawLang, rawHref] : signals.alternates) {
				std::string lang = trim(rawLang);
				std::string href = trim(rawHref);
				if (lang.empty() || href.empty())
					continue;
				if (auto resolved = Link::resolve(page, href))
					result.hreflang.push_back({ lang, resolved->getFullLink() });
			}

			for (const auto& content : signals.metaRobots)
				result.metaRobots = RobotsDirectives::merge(result.metaRobots, RobotsDirectives::parse(content));
			return canonicalHref;
		}

	}

	IndexabilityAuditor::IndexabilityAuditor(HttpTransport& transport, Config config)
		: m_config(std::move(config)),
		  m_fetcher(transport, m_config.fetchOptions()),
		  m_pool(static_cast<size_t>(std::max(m_config.maxConcurrency, 1))) {
	}

	std::vector<AuditResult> IndexabilityAuditor::audit(const AuditRequest& request) {
		if (request.urls.empty())
			throw InvalidRequest("urls must not be empty");
		if (request.urls.size() > MAX_URLS)
			throw InvalidRequest("at most " + std::to_string(MAX_URLS) + " urls per audit");

		const std::string userAgent = request.userAgent && !request.userAgent->empty() ? *request.userAgent
			: m_config.userAgent;
		log::info("Auditing ", request.urls.size(), " urls");

		std::vector<AuditResult> results;
		results.reserve(request.urls.size());
		for (size_t offset = 0; offset < request.urls.size(); offset += m_pool.size()) {
			size_t end = std::min(request.urls.size(), offset + m_pool.size());
			std::vector<std::future<AuditResult>> futures;
			for (size_t i = offset; i < end; ++i)
				futures.push_back(m_pool.enqueue([this, &url = request.urls[i], &userAgent] { return auditUrl(url, userAgent); }));
			for (auto& future : futures)
				future.wait();
			for (auto& future : futures)
				results.push_back(future.get());
		}
		return results;
	}

	AuditResult IndexabilityAuditor::auditUrl(const std::string& url, const std::string& userAgent) const {
		AuditResult result;
		result.url = url;
		result.finalUrl = url;

		FetchResult fetched;
		try {
			fetched = m_fetcher.fetchChain(url, userAgent);
		}
		catch (const FetchError& ex) {
			log::debug("Audit fetch failed for ", url, ": ", ex.what());
			result.issues.push_back(issues::FETCH_FAILED);
			return result;
		}

		result.finalUrl = fetched.finalUrl;
		result.status = fetched.response.statusCode;
		result.contentType = fetched.response.contentType();
		result.redirectChain = std::move(fetched.redirectChain);

		for (const auto& value : fetched.response.headerValues("x-robots-tag"))
			result.xRobots = RobotsDirectives::merge(result.xRobots, RobotsDirectives::parse(value));

		auto page = Link::parse(result.finalUrl);
		std::optional<std::string> canonicalHref;
		if (page && result.status != 204 && isHtml(result.contentType) && !fetched.response.text.empty())
			canonicalHref = applyHtmlSignals(result, *page, fetched.response.text);

		result.noindexMeta = result.metaRobots && result.metaRobots->isNoindex();
		result.noindexHeader = result.xRobots && result.xRobots->isNoindex();
		//boolean flags: an unasserted side counts as "index"
		if (result.noindexMeta != result.noindexHeader)
			result.issues.push_back(issues::CONFLICTING_NOINDEX);

		if (canonicalHref) {
			auto canonical = Link::resolve(*page, *canonicalHref);
			if (!canonical) {
				result.issues.push_back(issues::INVALID_CANONICAL);
			}
			else {
				result.canonical = canonical->getFullLink();
				if (!UrlCanonicalizer::sameETLD1(*page, *canonical))
					result.issues.push_back(issues::CANONICAL_OTHER_DOMAIN);
			}
		}

		return result;
	}

}
