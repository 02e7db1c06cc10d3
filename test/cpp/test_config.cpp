// Tests for environment driven configuration

#include <cassert>
#include <iostream>
#include <map>
#include <string>

#include "seocrawler/Config.h"

using namespace seocrawler;

static Config load(const std::map<std::string, std::string>& env) {
	return Config::fromLookup([&env](const std::string& name) -> std::optional<std::string> {
		auto it = env.find(name);
		if (it == env.end())
			return std::nullopt;
		return it->second;
	});
}

void test_defaults() {
	Config config = load({});
	assert(config.defaultDepth == 2);
	assert(config.maxPages == 500);
	assert(config.userAgent == "seocrawler");
	assert(config.fallbackUserAgent == Fetcher::DEFAULT_FALLBACK_USER_AGENT);
	assert(config.maxConcurrency == 6);
	assert(!config.respectRobots);
	assert(config.timeout == std::chrono::milliseconds(20000));
	assert(config.snapshotDir == "./data/snapshots");
	assert(config.logLevel == log::Level::Info);
	assert(config.host == "127.0.0.1");
	assert(config.port == 8787);
	assert(!config.ignoreExtensionsFile.empty());
	std::cout << "✓ test_defaults\n";
}

void test_overrides() {
	Config config = load({
		{ "CRAWLER_DEFAULT_DEPTH", "3" },
		{ "CRAWLER_MAX_PAGES", "250" },
		{ "CRAWLER_USER_AGENT", "MyBot/1.0" },
		{ "CRAWLER_FALLBACK_USER_AGENT", "Browser/2.0" },
		{ "CRAWLER_RESPECT_ROBOTS", "1" },
		{ "CRAWLER_TIMEOUT_MS", "1500" },
		{ "CRAWLER_IGNORE_EXT_FILE", "/etc/seocrawler/ignore.txt" },
		{ "CRAWLER_LOG_LEVEL", "DEBUG" },
		{ "CRAWLER_HOST", "0.0.0.0" },
		{ "PORT", "9001" },
	});
	assert(config.defaultDepth == 3);
	assert(config.maxPages == 250);
	assert(config.userAgent == "MyBot/1.0");
	assert(config.respectRobots);
	assert(config.ignoreExtensionsFile == "/etc/seocrawler/ignore.txt");
	assert(config.logLevel == log::Level::Debug);
	assert(config.host == "0.0.0.0");
	assert(config.port == 9001);

	FetchOptions options = config.fetchOptions();
	assert(options.timeout == std::chrono::milliseconds(1500));
	assert(options.fallbackUserAgent == "Browser/2.0");
	std::cout << "✓ test_overrides\n";
}

void test_bad_values_fall_back() {
	Config config = load({
		{ "CRAWLER_MAX_PAGES", "lots" },
		{ "CRAWLER_MAX_CONCURRENCY", "0" },
		{ "CRAWLER_TIMEOUT_MS", "-5" },
		{ "CRAWLER_RESPECT_ROBOTS", "yes please" },
		{ "CRAWLER_USER_AGENT", "" },
		{ "CRAWLER_SNAPSHOT_DIR", "" },
	});
	assert(config.maxPages == 500);
	assert(config.maxConcurrency == 1);
	assert(config.timeout == std::chrono::milliseconds(1));
	assert(!config.respectRobots);
	assert(config.userAgent == "seocrawler");
	//empty snapshot dir switches snapshots off
	assert(config.snapshotDir.empty());
	std::cout << "✓ test_bad_values_fall_back\n";
}

void test_log_levels() {
	assert(log::parseLevel("warn") == log::Level::Warn);
	assert(log::parseLevel("Warning") == log::Level::Warn);
	assert(log::parseLevel("error") == log::Level::Error);
	assert(log::parseLevel("verbose") == log::Level::Info);

	log::setLevel(log::Level::Error);
	assert(log::level() == log::Level::Error);
	log::setLevel(log::Level::Info);
	std::cout << "✓ test_log_levels\n";
}

int main() {
	std::cout << "Running Config tests...\n\n";

	test_defaults();
	test_overrides();
	test_bad_values_fall_back();
	test_log_levels();

	std::cout << "\nAll tests passed!\n";
	return 0;
}
