#include "seocrawler/Log.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace seocrawler {
namespace log {

	namespace {
		std::atomic<int> g_level{ static_cast<int>(Level::Info) };
		std::mutex g_outputMutex;

		const char* prefix(Level level) {
			switch (level) {
			case Level::Debug: return "[debug] ";
			case Level::Info: return "[info] ";
			case Level::Warn: return "[warn] ";
			case Level::Error: return "[error] ";
			}
			return "";
		}
	}

	void setLevel(Level level) {
		g_level = static_cast<int>(level);
	}

	Level level() {
		return static_cast<Level>(g_level.load());
	}

	Level parseLevel(const std::string& name) {
		std::string lower = name;
		std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
		if (lower == "debug")
			return Level::Debug;
		if (lower == "warn" || lower == "warning")
			return Level::Warn;
		if (lower == "error")
			return Level::Error;
		return Level::Info;
	}

	void write(Level level, const std::string& line) {
		std::lock_guard<std::mutex> lock(g_outputMutex);
		//warnings and errors go to stderr like the crawl failures always did
		if (level >= Level::Warn)
			std::cerr << prefix(level) << line << std::endl;
		else
			std::cout << prefix(level) << line << std::endl;
	}

}
}
