#pragma once

#include "seocrawler/HttpTransport.h"

#include <chrono>
#include <string>
#include <vector>

namespace seocrawler {

	struct RedirectHop {
		std::string from;
		std::string to;
		int status = 0;
	};

	using RedirectChain = std::vector<RedirectHop>;

	struct FetchResult {
		HttpResponse response;
		std::string finalUrl;
		RedirectChain redirectChain;
	};

	struct FetchOptions {
		std::chrono::milliseconds timeout{ 20000 };
		std::string fallbackUserAgent;
	};

	//one logical GET: manual redirects, bounded hops, browser UA retry when blocked
	class Fetcher {
	public:
		static constexpr int MAX_REDIRECTS = 10;
		static const char* const DEFAULT_FALLBACK_USER_AGENT;

		Fetcher(HttpTransport& transport, FetchOptions options);

		//throws FetchError when nothing could be fetched, fallback included
		FetchResult fetchChain(const std::string& url, const std::string& userAgent) const;

		static bool isRedirectStatus(int status);

		//statuses waf / anti-bot layers answer with
		static bool isBlockedStatus(int status);

		const FetchOptions& getOptions() const { return m_options; }

	private:
		FetchResult followRedirects(const std::string& url, const std::string& userAgent) const;
		HttpResponse send(const std::string& url, const std::string& userAgent) const;

		HttpTransport& m_transport;
		FetchOptions m_options;
	};

}
