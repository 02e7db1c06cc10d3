#include "seocrawler/CprTransport.h"

#include "seocrawler/Errors.h"

#include <cpr/cpr.h>
#include <sstream>

namespace seocrawler {

	HttpResponse CprTransport::get(const HttpRequest& request) {
		cpr::Header header;
		for (const auto& [name, value] : request.headers)
			header[name] = value;

		cpr::Response response = cpr::Get(cpr::Url{ request.url }, header, cpr::Timeout{ request.timeout },
			cpr::Redirect{ false });

		if (response.error.code != cpr::ErrorCode::OK)
			throw TransportError("Failed to fetch " + request.url + ": " + response.error.message);

		HttpResponse out;
		out.statusCode = static_cast<int>(response.status_code);
		out.url = response.url.str();
		out.headers = parseRawHeaders(response.raw_header);
		if (out.headers.empty()) {
			for (const auto& [name, value] : response.header)
				out.headers.emplace_back(name, value);
		}
		out.text = std::move(response.text);
		return out;
	}

	HeaderList CprTransport::parseRawHeaders(const std::string& rawHeader) {
		HeaderList headers;
		std::istringstream iss(rawHeader);
		for (std::string line; std::getline(iss, line);) {
			if (!line.empty() && line.back() == '\r')
				line.pop_back();

			//a new status line starts a new header block (100 Continue, proxies)
			if (line.rfind("HTTP/", 0) == 0) {
				headers.clear();
				continue;
			}

			size_t colon = line.find(':');
			if (colon == std::string::npos || colon == 0)
				continue;

			std::string name = line.substr(0, colon);
			std::string value = line.substr(colon + 1);
			size_t start = value.find_first_not_of(" \t");
			size_t end = value.find_last_not_of(" \t");
			value = start == std::string::npos ? "" : value.substr(start, end - start + 1);
			headers.emplace_back(std::move(name), std::move(value));
		}
		return headers;
	}

}
