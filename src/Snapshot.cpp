#include "seocrawler/Snapshot.h"

#include "seocrawler/Link.h"

#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace seocrawler {

	std::string snapshotTimestamp(std::chrono::system_clock::time_point now) {
		std::time_t seconds = std::chrono::system_clock::to_time_t(now);
		auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

		std::tm utc{};
		gmtime_r(&seconds, &utc);
		std::ostringstream oss;
		oss << std::put_time(&utc, "%Y-%m-%dT%H-%M-%S") << '-' << std::setw(3) << std::setfill('0') << millis << 'Z';
		return oss.str();
	}

	std::string snapshotPath(const std::string& dir, const std::string& startUrl, const std::string& timestamp) {
		std::string host = "unknown";
		if (auto link = Link::parse(startUrl)) {
			host = link->getHost();
			if (!link->getPort().empty())
				host += ":" + link->getPort();
		}
		for (char& c : host) {
			if (c == ':' || c == '/' || c == '\\')
				c = '_';
		}
		return (std::filesystem::path(dir) / (host + "-" + timestamp + ".json")).string();
	}

	void writeJsonFile(const std::string& path, const nlohmann::json& document) {
		std::filesystem::path target(path);
		if (target.has_parent_path()) {
			std::error_code ec;
			std::filesystem::create_directories(target.parent_path(), ec);
			if (ec)
				throw std::runtime_error("Failed to create " + target.parent_path().string() + ": " + ec.message());
		}

		std::ofstream file(target);
		if (!file.is_open())
			throw std::runtime_error("Failed to open " + path + " for writing");
		file << document.dump(2);
		if (!file)
			throw std::runtime_error("Failed to write " + path);
	}

}
