#include "seocrawler/Fetcher.h"

#include "seocrawler/Errors.h"
#include "seocrawler/Link.h"
#include "seocrawler/Log.h"

namespace seocrawler {

	const char* const Fetcher::DEFAULT_FALLBACK_USER_AGENT =
		"Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) "
		"Chrome/124.0.0.0 Safari/537.36";

	namespace {
		constexpr const char* ACCEPT = "text/html,application/xhtml+xml,application/xml;q=0.9,*/*;q=0.8";
		constexpr const char* ACCEPT_LANGUAGE = "en-US,en;q=0.9,es;q=0.8";
	}

	Fetcher::Fetcher(HttpTransport& transport, FetchOptions options)
		: m_transport(transport), m_options(std::move(options)) {
		if (m_options.fallbackUserAgent.empty())
			m_options.fallbackUserAgent = DEFAULT_FALLBACK_USER_AGENT;
	}

	bool Fetcher::isRedirectStatus(int status) {
		return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
	}

	bool Fetcher::isBlockedStatus(int status) {
		switch (status) {
		case 403:
		case 406:
		case 409:
		case 410:
		case 429:
		case 451:
		case 503:
			return true;
		default:
			return false;
		}
	}

	FetchResult Fetcher::fetchChain(const std::string& url, const std::string& userAgent) const {
		if (!Link::parse(url))
			throw FetchError("Invalid url: " + url);

		const std::string& fallback = m_options.fallbackUserAgent;
		FetchResult result;
		try {
			result = followRedirects(url, userAgent);
		}
		catch (const TransportError& ex) {
			if (userAgent == fallback)
				throw FetchError(ex.what());

			log::debug("Fetch of ", url, " failed (", ex.what(), "), retrying with fallback user agent");
			try {
				return followRedirects(url, fallback);
			}
			catch (const TransportError& retryEx) {
				throw FetchError(retryEx.what());
			}
		}

		if (isBlockedStatus(result.response.statusCode) && userAgent != fallback) {
			log::info("Blocked with status ", result.response.statusCode, " on ", result.finalUrl,
				", retrying with fallback user agent");
			try {
				return followRedirects(url, fallback);
			}
			catch (const TransportError& ex) {
				//keep the blocked answer, it is still an answer
				log::debug("Fallback retry of ", url, " failed: ", ex.what());
			}
		}
		return result;
	}

	FetchResult Fetcher::followRedirects(const std::string& url, const std::string& userAgent) const {
		FetchResult result;
		std::string current = url;
		HttpResponse response = send(current, userAgent);

		while (isRedirectStatus(response.statusCode) && static_cast<int>(result.redirectChain.size()) < MAX_REDIRECTS) {
			auto location = response.header("location");
			if (!location || location->empty())
				break;

			auto next = Link::absolutize(current, *location);
			if (!next) {
				log::debug("Unresolvable redirect location '", *location, "' from ", current);
				break;
			}

			result.redirectChain.push_back({ current, *next, response.statusCode });
			current = *next;
			response = send(current, userAgent);
		}

		result.response = std::move(response);
		result.finalUrl = current;
		return result;
	}

	HttpResponse Fetcher::send(const std::string& url, const std::string& userAgent) const {
		HttpRequest request;
		request.url = url;
		request.timeout = m_options.timeout;
		request.headers = {
			{ "User-Agent", userAgent },
			{ "Accept", ACCEPT },
			{ "Accept-Language", ACCEPT_LANGUAGE },
		};
		return m_transport.get(request);
	}

}
