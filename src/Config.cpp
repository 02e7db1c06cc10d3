#include "seocrawler/Config.h"

#include <algorithm>
#include <cstdlib>
#include <stdexcept>

#ifndef SEOCRAWLER_DEFAULT_IGNORE_FILE
#define SEOCRAWLER_DEFAULT_IGNORE_FILE "assets/ignore-extensions.txt"
#endif

namespace seocrawler {

	namespace {

		std::optional<int> parseInt(const std::string& value) {
			try {
				size_t pos = 0;
				int parsed = std::stoi(value, &pos);
				if (pos != value.size())
					return std::nullopt;
				return parsed;
			}
			catch (const std::invalid_argument&) {
				return std::nullopt;
			}
			catch (const std::out_of_range&) {
				return std::nullopt;
			}
		}

		void readInt(const Config::Lookup& lookup, const std::string& name, int& target, int minimum) {
			auto raw = lookup(name);
			if (!raw || raw->empty())
				return;
			auto value = parseInt(*raw);
			if (!value) {
				log::warn("Ignoring non-numeric ", name, "=", *raw, ", keeping ", target);
				return;
			}
			target = std::max(*value, minimum);
		}

		void readString(const Config::Lookup& lookup, const std::string& name, std::string& target) {
			auto raw = lookup(name);
			if (raw && !raw->empty())
				target = *raw;
		}

	}

	Config Config::fromEnvironment() {
		return fromLookup([](const std::string& name) -> std::optional<std::string> {
			const char* value = std::getenv(name.c_str());
			if (!value)
				return std::nullopt;
			return std::string(value);
		});
	}

	Config Config::fromLookup(const Lookup& lookup) {
		Config config;

		readInt(lookup, "CRAWLER_DEFAULT_DEPTH", config.defaultDepth, 0);
		readInt(lookup, "CRAWLER_MAX_PAGES", config.maxPages, 0);
		readInt(lookup, "CRAWLER_MAX_CONCURRENCY", config.maxConcurrency, 1);
		readString(lookup, "CRAWLER_USER_AGENT", config.userAgent);
		readString(lookup, "CRAWLER_FALLBACK_USER_AGENT", config.fallbackUserAgent);

		if (auto respect = lookup("CRAWLER_RESPECT_ROBOTS"))
			config.respectRobots = *respect == "1" || *respect == "true";

		int timeoutMs = static_cast<int>(config.timeout.count());
		readInt(lookup, "CRAWLER_TIMEOUT_MS", timeoutMs, 1);
		config.timeout = std::chrono::milliseconds(timeoutMs);

		readString(lookup, "CRAWLER_IGNORE_EXT_FILE", config.ignoreExtensionsFile);
		//an explicitly empty snapshot dir turns snapshots off
		if (auto snapshotDir = lookup("CRAWLER_SNAPSHOT_DIR"))
			config.snapshotDir = *snapshotDir;

		if (auto level = lookup("CRAWLER_LOG_LEVEL"))
			config.logLevel = log::parseLevel(*level);

		readString(lookup, "CRAWLER_HOST", config.host);
		readInt(lookup, "PORT", config.port, 1);

		return config;
	}

	std::string Config::defaultIgnoreExtensionsFile() {
		return SEOCRAWLER_DEFAULT_IGNORE_FILE;
	}

	FetchOptions Config::fetchOptions() const {
		FetchOptions options;
		options.timeout = timeout;
		options.fallbackUserAgent = fallbackUserAgent;
		return options;
	}

}
