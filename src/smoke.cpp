#include "seocrawler/Config.h"
#include "seocrawler/CprTransport.h"
#include "seocrawler/Crawler.h"
#include "seocrawler/Errors.h"
#include "seocrawler/JsonCodec.h"
#include "seocrawler/Log.h"
#include "seocrawler/Snapshot.h"
#include "seocrawler/UrlCanonicalizer.h"

#include <algorithm>
#include <iostream>
#include <string>

using namespace seocrawler;

namespace {

	int usage(const char* program) {
		std::cerr << "usage: " << program << " <startUrl> [depth] [maxPages]" << std::endl;
		return 1;
	}

}

int main(int argc, char** argv) {
	if (argc < 2)
		return usage(argv[0]);

	Config config = Config::fromEnvironment();
	log::setLevel(config.logLevel);

	CrawlRequest request;
	request.startUrl = argv[1];
	request.depth = 3;
	request.maxPages = 100;
	try {
		if (argc > 2)
			request.depth = std::stoi(argv[2]);
		if (argc > 3)
			request.maxPages = std::stoi(argv[3]);
	}
	catch (const std::logic_error&) {
		return usage(argv[0]);
	}

	CprTransport transport;
	Crawler crawler(transport, config, UrlCanonicalizer(IgnoreList::fromFile(config.ignoreExtensionsFile)));

	CrawlResult result;
	try {
		result = crawler.crawl(request);
	}
	catch (const InvalidRequest& ex) {
		std::cerr << "Invalid request: " << ex.what() << std::endl;
		return 1;
	}

	json out = result;
	std::cout << "=== STATS ===" << std::endl;
	std::cout << out["stats"].dump(2) << std::endl;
	std::cout << "statusBuckets: " << out["reports"]["statusBuckets"].dump() << std::endl;

	std::cout << "linkedNotInSitemap (top 10):" << std::endl;
	const auto& linked = result.reports.linkedNotInSitemap;
	for (size_t i = 0; i < std::min<size_t>(10, linked.size()); ++i)
		std::cout << "  " << linked[i] << std::endl;

	std::string path = "tmp/snapshot-" + snapshotTimestamp() + ".json";
	try {
		writeJsonFile(path, out);
	}
	catch (const std::runtime_error& ex) {
		std::cerr << "Failed to save snapshot: " << ex.what() << std::endl;
		return 1;
	}
	std::cout << "Snapshot saved to: " << path << std::endl;
	return 0;
}
