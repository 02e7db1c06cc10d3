// Unit tests for robots.txt parsing and the per-origin policy cache

#include <cassert>
#include <iostream>
#include <string>

#include "FakeTransport.h"
#include "seocrawler/Robots.h"

using namespace seocrawler;

static const char* ROBOTS = R"(# shop robots
User-agent: *
Disallow: /private
Allow: /private/public
Crawl-delay: 2

User-agent: seobot
User-agent: otherbot
Disallow: /
Allow: /open$

Sitemap: https://ex.com/sitemap.xml
)";

void test_wildcard_group() {
	robots::Parser parser(ROBOTS);
	assert(!parser.checkUrl("/private/x"));
	assert(parser.checkUrl("/private/public/x"));
	assert(parser.checkUrl("/index"));
	assert(parser.getDelay() == 2.0);
	assert(parser.getSitemaps().size() == 1);
	assert(parser.getGroups().size() == 2);
	std::cout << "✓ test_wildcard_group\n";
}

void test_agent_selection() {
	robots::Parser parser(ROBOTS);
	assert(!parser.checkUrl("/anything", "seobot"));
	assert(parser.checkUrl("/open", "seobot"));
	assert(!parser.checkUrl("/open/more", "seobot"));
	assert(!parser.checkUrl("/anything", "SeoBot/2.0 (+https://ex.com/bot)"));
	assert(!parser.checkUrl("/anything", "otherbot"));
	//prefix match on the product token
	assert(!parser.checkUrl("/anything", "seobot-news"));
	//robots.txt itself stays reachable
	assert(parser.checkUrl("/robots.txt", "seobot"));
	assert(!parser.getDelay("seobot"));
	std::cout << "✓ test_agent_selection\n";
}

void test_precedence_and_patterns() {
	robots::Parser tie("User-agent: *\nDisallow: /page\nAllow: /page\n");
	assert(tie.checkUrl("/page"));

	robots::Parser pdf("User-agent: *\nDisallow: /*.pdf$\n");
	assert(!pdf.checkUrl("/docs/a.pdf"));
	assert(pdf.checkUrl("/docs/a.pdf?x=1"));
	assert(pdf.checkUrl("/docs/a.html"));

	robots::Parser special("User-agent: *\nDisallow: /a+b(c)\n");
	assert(!special.checkUrl("/a+b(c)/d"));
	assert(special.checkUrl("/aab"));
	std::cout << "✓ test_precedence_and_patterns\n";
}

void test_orphan_rules_and_missing_group() {
	robots::Parser orphan("Disallow: /x\nUser-agent: *\nAllow: /\n");
	assert(orphan.checkUrl("/x"));

	robots::Parser emptyDisallow("User-agent: *\nDisallow:\n");
	assert(emptyDisallow.checkUrl("/anything"));

	robots::Parser googleOnly("User-agent: googlebot\nDisallow: /\n");
	assert(googleOnly.checkUrl("/a", "seobot"));
	assert(!googleOnly.checkUrl("/a", "Googlebot/2.1"));

	robots::Parser badDelay("User-agent: *\nCrawl-delay: soon\n");
	assert(!badDelay.getDelay());
	std::cout << "✓ test_orphan_rules_and_missing_group\n";
}

void test_agent_view() {
	auto parser = std::make_shared<const robots::Parser>(ROBOTS);
	RobotsAgent agent(parser, "seobot");
	assert(!agent.isAllowed("https://ex.com/shop"));
	assert(agent.isAllowed("https://ex.com/open"));
	//no delay in its own group, falls back to *
	assert(agent.getCrawlDelay() == 2.0);
	assert(agent.getSitemaps().front() == "https://ex.com/sitemap.xml");

	auto open = RobotsAgent::allowAll();
	assert(open->isAllowed("https://ex.com/private"));
	assert(!open->getCrawlDelay());
	assert(open->getSitemaps().empty());
	std::cout << "✓ test_agent_view\n";
}

void test_provider_caches_per_origin() {
	FakeTransport transport;
	transport.on("https://ex.com/robots.txt", textDocument("User-agent: *\nDisallow: /admin\n"));
	Fetcher fetcher(transport, FetchOptions{});
	RobotsPolicyProvider provider(fetcher);

	auto agent = provider.getAgent("https://ex.com", "seobot");
	assert(!agent->isAllowed("https://ex.com/admin/users"));
	assert(agent->isAllowed("https://ex.com/"));

	auto again = provider.getAgent("https://ex.com", "seobot");
	assert(!again->isAllowed("https://ex.com/admin"));
	assert(transport.count("https://ex.com/robots.txt") == 1);
	std::cout << "✓ test_provider_caches_per_origin\n";
}

void test_provider_fails_open() {
	FakeTransport transport;
	transport.on("https://blocked.com/robots.txt", textDocument("User-agent: *\nDisallow: /\n", 500));
	transport.fail("https://down.com/robots.txt");
	Fetcher fetcher(transport, FetchOptions{});
	RobotsPolicyProvider provider(fetcher);

	assert(provider.getAgent("https://missing.com", "seobot")->isAllowed("https://missing.com/x"));
	assert(provider.getAgent("https://blocked.com", "seobot")->isAllowed("https://blocked.com/x"));
	assert(provider.getAgent("https://down.com", "seobot")->isAllowed("https://down.com/x"));

	size_t attempts = transport.count("https://down.com/robots.txt");
	provider.getAgent("https://down.com", "seobot");
	assert(transport.count("https://down.com/robots.txt") == attempts);
	std::cout << "✓ test_provider_fails_open\n";
}

int main() {
	std::cout << "Running robots tests...\n\n";

	test_wildcard_group();
	test_agent_selection();
	test_precedence_and_patterns();
	test_orphan_rules_and_missing_group();
	test_agent_view();
	test_provider_caches_per_origin();
	test_provider_fails_open();

	std::cout << "\nAll tests passed!\n";
	return 0;
}
