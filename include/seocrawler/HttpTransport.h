#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace seocrawler {

	using HeaderList = std::vector<std::pair<std::string, std::string>>;

	struct HttpRequest {
		std::string url;
		HeaderList headers;
		std::chrono::milliseconds timeout{ 20000 };
	};

	struct HttpResponse {
		int statusCode = 0;
		std::string url;
		//every header line in arrival order, names as sent by the server
		HeaderList headers;
		std::string text;

		//first value of a header, case-insensitive name
		std::optional<std::string> header(const std::string& name) const;

		//all values of a header that may repeat (X-Robots-Tag)
		std::vector<std::string> headerValues(const std::string& name) const;

		std::optional<std::string> contentType() const { return header("content-type"); }

		bool ok() const { return statusCode >= 200 && statusCode < 300; }
	};

	//one request/response exchange, never follows redirects
	class HttpTransport {
	public:
		virtual ~HttpTransport() = default;

		//throws TransportError when no response could be obtained
		virtual HttpResponse get(const HttpRequest& request) = 0;
	};

}
