// Unit tests for redirect following and the fallback user agent retry

#include <cassert>
#include <iostream>
#include <string>

#include "FakeTransport.h"
#include "seocrawler/CprTransport.h"
#include "seocrawler/Fetcher.h"

using namespace seocrawler;

static const std::string FALLBACK = Fetcher::DEFAULT_FALLBACK_USER_AGENT;

void test_redirect_chain() {
	FakeTransport transport;
	transport.on("https://ex.com/a", redirectTo("https://ex.com/b", 301));
	transport.on("https://ex.com/b", redirectTo("/c", 302));
	transport.on("https://ex.com/c", htmlPage("<html>done</html>"));
	Fetcher fetcher(transport, FetchOptions{});

	FetchResult result = fetcher.fetchChain("https://ex.com/a", "X");
	assert(result.response.statusCode == 200);
	assert(result.finalUrl == "https://ex.com/c");
	assert(result.redirectChain.size() == 2);
	assert(result.redirectChain[0].from == "https://ex.com/a");
	assert(result.redirectChain[0].to == "https://ex.com/b");
	assert(result.redirectChain[0].status == 301);
	assert(result.redirectChain[1].to == "https://ex.com/c");
	assert(result.redirectChain[1].status == 302);
	std::cout << "✓ test_redirect_chain\n";
}

void test_redirect_without_location() {
	FakeTransport transport;
	transport.on("https://ex.com/a", statusOnly(301));
	Fetcher fetcher(transport, FetchOptions{});

	FetchResult result = fetcher.fetchChain("https://ex.com/a", "X");
	assert(result.response.statusCode == 301);
	assert(result.finalUrl == "https://ex.com/a");
	assert(result.redirectChain.empty());
	std::cout << "✓ test_redirect_without_location\n";
}

void test_redirect_loop_is_capped() {
	FakeTransport transport;
	transport.on("https://ex.com/a", redirectTo("https://ex.com/b", 307));
	transport.on("https://ex.com/b", redirectTo("https://ex.com/a", 308));
	Fetcher fetcher(transport, FetchOptions{});

	FetchResult result = fetcher.fetchChain("https://ex.com/a", "X");
	assert(result.redirectChain.size() == static_cast<size_t>(Fetcher::MAX_REDIRECTS));
	assert(Fetcher::isRedirectStatus(result.response.statusCode));
	std::cout << "✓ test_redirect_loop_is_capped\n";
}

void test_blocked_status_retries_with_fallback() {
	FakeTransport transport;
	transport.onAgent("https://ex.com/", "X", statusOnly(403));
	transport.on("https://ex.com/", htmlPage("<html>welcome</html>"));
	Fetcher fetcher(transport, FetchOptions{});

	FetchResult result = fetcher.fetchChain("https://ex.com/", "X");
	assert(result.response.statusCode == 200);
	assert(result.finalUrl == "https://ex.com/");
	auto requests = transport.requests();
	assert(requests.size() == 2);
	assert(requests[0].second == "X");
	assert(requests[1].second == FALLBACK);
	std::cout << "✓ test_blocked_status_retries_with_fallback\n";
}

void test_blocked_result_kept_when_retry_fails() {
	FakeTransport transport;
	transport.onAgent("https://ex.com/", "X", statusOnly(429));
	transport.fail("https://ex.com/", FALLBACK);
	Fetcher fetcher(transport, FetchOptions{});

	FetchResult result = fetcher.fetchChain("https://ex.com/", "X");
	assert(result.response.statusCode == 429);
	std::cout << "✓ test_blocked_result_kept_when_retry_fails\n";
}

void test_blocked_with_fallback_agent_is_final() {
	FakeTransport transport;
	transport.on("https://ex.com/", statusOnly(503));
	Fetcher fetcher(transport, FetchOptions{});

	FetchResult result = fetcher.fetchChain("https://ex.com/", FALLBACK);
	assert(result.response.statusCode == 503);
	assert(transport.count("https://ex.com/") == 1);
	std::cout << "✓ test_blocked_with_fallback_agent_is_final\n";
}

void test_transport_failure_retries_once() {
	FakeTransport transport;
	transport.fail("https://ex.com/", "X");
	transport.on("https://ex.com/", htmlPage("<html>ok</html>"));
	Fetcher fetcher(transport, FetchOptions{});

	FetchResult result = fetcher.fetchChain("https://ex.com/", "X");
	assert(result.response.statusCode == 200);
	assert(transport.count("https://ex.com/") == 2);
	std::cout << "✓ test_transport_failure_retries_once\n";
}

void test_unreachable_raises_fetch_error() {
	FakeTransport transport;
	transport.fail("https://down.com/");
	Fetcher fetcher(transport, FetchOptions{});

	bool thrown = false;
	try {
		fetcher.fetchChain("https://down.com/", "X");
	}
	catch (const FetchError&) {
		thrown = true;
	}
	assert(thrown);
	assert(transport.count("https://down.com/") == 2);

	thrown = false;
	try {
		fetcher.fetchChain("https://down.com/", FALLBACK);
	}
	catch (const FetchError&) {
		thrown = true;
	}
	assert(thrown);
	assert(transport.count("https://down.com/") == 3);

	thrown = false;
	try {
		fetcher.fetchChain("not a url", "X");
	}
	catch (const FetchError&) {
		thrown = true;
	}
	assert(thrown);
	std::cout << "✓ test_unreachable_raises_fetch_error\n";
}

void test_configured_fallback_agent() {
	FakeTransport transport;
	transport.onAgent("https://ex.com/", "X", statusOnly(406));
	transport.onAgent("https://ex.com/", "MyBrowser/1.0", htmlPage("<html>ok</html>"));
	FetchOptions options;
	options.fallbackUserAgent = "MyBrowser/1.0";
	Fetcher fetcher(transport, options);

	assert(fetcher.fetchChain("https://ex.com/", "X").response.statusCode == 200);
	std::cout << "✓ test_configured_fallback_agent\n";
}

void test_raw_header_block() {
	std::string raw = "HTTP/1.1 100 Continue\r\n\r\n"
		"HTTP/1.1 200 OK\r\n"
		"Content-Type: text/html\r\n"
		"X-Robots-Tag: noindex\r\n"
		"X-Robots-Tag:  nofollow \r\n"
		"\r\n";
	HttpResponse response;
	response.headers = CprTransport::parseRawHeaders(raw);
	assert(response.headers.size() == 3);
	assert(response.contentType() == std::string("text/html"));
	auto robots = response.headerValues("x-robots-tag");
	assert(robots.size() == 2);
	assert(robots[1] == "nofollow");
	std::cout << "✓ test_raw_header_block\n";
}

int main() {
	std::cout << "Running Fetcher tests...\n\n";

	test_redirect_chain();
	test_redirect_without_location();
	test_redirect_loop_is_capped();
	test_blocked_status_retries_with_fallback();
	test_blocked_result_kept_when_retry_fails();
	test_blocked_with_fallback_agent_is_final();
	test_transport_failure_retries_once();
	test_unreachable_raises_fetch_error();
	test_configured_fallback_agent();
	test_raw_header_block();

	std::cout << "\nAll tests passed!\n";
	return 0;
}
