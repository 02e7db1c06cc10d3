#pragma once

#include <stdexcept>
#include <string>

namespace seocrawler {

	//request is structurally impossible (bad start url, bad budget, ...)
	class InvalidRequest : public std::invalid_argument {
	public:
		explicit InvalidRequest(const std::string& what) : std::invalid_argument(what) {}
	};

	//one http exchange failed (connect, tls, timeout, body read)
	class TransportError : public std::runtime_error {
	public:
		explicit TransportError(const std::string& what) : std::runtime_error(what) {}
	};

	//a logical fetch failed, fallback user agent included
	class FetchError : public std::runtime_error {
	public:
		explicit FetchError(const std::string& what) : std::runtime_error(what) {}
	};

}
