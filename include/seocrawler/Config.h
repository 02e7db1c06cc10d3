#pragma once

#include "seocrawler/Fetcher.h"
#include "seocrawler/Log.h"

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace seocrawler {

	//defaults substituted when a request leaves a field out
	struct Config {
		int defaultDepth = 2;
		int maxPages = 500;
		std::string userAgent = "seocrawler";
		std::string fallbackUserAgent = Fetcher::DEFAULT_FALLBACK_USER_AGENT;
		int maxConcurrency = 6;
		bool respectRobots = false;
		std::chrono::milliseconds timeout{ 20000 };
		std::string ignoreExtensionsFile = defaultIgnoreExtensionsFile();
		std::string snapshotDir = "./data/snapshots";
		log::Level logLevel = log::Level::Info;
		std::string host = "127.0.0.1";
		int port = 8787;

		using Lookup = std::function<std::optional<std::string>(const std::string&)>;

		//CRAWLER_* variables plus PORT
		static Config fromEnvironment();

		//same as fromEnvironment with an injectable variable source
		static Config fromLookup(const Lookup& lookup);

		static std::string defaultIgnoreExtensionsFile();

		FetchOptions fetchOptions() const;
	};

}
