#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>

namespace seocrawler {

	//iso-8601 utc with ':' and '.' replaced by '-', safe inside file names
	std::string snapshotTimestamp(std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

	//<dir>/<host>-<timestamp>.json, the host with ':' '/' '\' turned into '_'
	std::string snapshotPath(const std::string& dir, const std::string& startUrl, const std::string& timestamp);

	//creates missing parent directories, throws std::runtime_error when the file cannot be written
	void writeJsonFile(const std::string& path, const nlohmann::json& document);

}
