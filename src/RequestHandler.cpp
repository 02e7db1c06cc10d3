#include "seocrawler/RequestHandler.h"

#include "seocrawler/Errors.h"
#include "seocrawler/Log.h"
#include "seocrawler/Snapshot.h"

namespace seocrawler {

	namespace {

		json failure(const std::string& message) {
			return json{ { "ok", false }, { "error", message } };
		}

		json paramsOf(const json& message) {
			auto it = message.find("params");
			if (it == message.end())
				return json::object();
			return *it;
		}

	}

	RequestHandler::RequestHandler(Crawler& crawler, IndexabilityAuditor& auditor, std::string snapshotDir)
		: m_crawler(crawler), m_auditor(auditor), m_snapshotDir(std::move(snapshotDir)) {
	}

	std::string RequestHandler::handle(const std::string& message) {
		json parsed;
		try {
			parsed = json::parse(message);
			//some clients send the message json-encoded a second time
			if (parsed.is_string())
				parsed = json::parse(parsed.get<std::string>());
		}
		catch (const json::parse_error& ex) {
			log::warn("Error parsing json: ", ex.what());
			return failure("parse_error").dump();
		}
		return dispatch(parsed).dump();
	}

	json RequestHandler::dispatch(const json& message) {
		try {
			if (!message.is_object())
				throw InvalidRequest("message must be an object");
			auto action = message.find("action");
			if (action == message.end() || !action->is_string())
				throw InvalidRequest("action is required");

			if (*action == "health")
				return json{ { "ok", true } };
			if (*action == "crawl")
				return crawl(paramsOf(message));
			if (*action == "audit")
				return audit(paramsOf(message));
			throw InvalidRequest("unknown action: " + action->get<std::string>());
		}
		catch (const InvalidRequest& ex) {
			return failure(ex.what());
		}
		catch (const json::exception& ex) {
			return failure(ex.what());
		}
		catch (const std::exception& ex) {
			log::error("Request failed: ", ex.what());
			return failure(ex.what());
		}
	}

	json RequestHandler::crawl(const json& params) {
		CrawlRequest request = parseCrawlRequest(params);
		json output = m_crawler.crawl(request);

		auto file = writeSnapshot(request, output);
		return json{
			{ "ok", true },
			{ "action", "crawl" },
			{ "snapshotFile", file ? json(*file) : json(nullptr) },
			{ "output", std::move(output) },
		};
	}

	json RequestHandler::audit(const json& params) {
		AuditRequest request = parseAuditRequest(params);
		return json{
			{ "ok", true },
			{ "action", "audit" },
			{ "results", m_auditor.audit(request) },
		};
	}

	std::optional<std::string> RequestHandler::writeSnapshot(const CrawlRequest& request, const json& output) const {
		if (m_snapshotDir.empty())
			return std::nullopt;

		std::string path = snapshotPath(m_snapshotDir, request.startUrl, snapshotTimestamp());
		try {
			writeJsonFile(path, json{ { "input", toJson(request) }, { "output", output } });
		}
		catch (const std::runtime_error& ex) {
			log::error("Failed to save snapshot: ", ex.what());
			return std::nullopt;
		}
		log::info("Snapshot saved to ", path);
		return path;
	}

}
