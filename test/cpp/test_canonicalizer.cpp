// Unit tests for normalized keys, internality and the extension ignore list

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "seocrawler/UrlCanonicalizer.h"

using namespace seocrawler;

void test_equivalent_urls_share_a_key() {
	std::string a = UrlCanonicalizer::normalizeForKey("https://EX.com/a/?b=2&a=1#frag");
	std::string b = UrlCanonicalizer::normalizeForKey("https://ex.com/a?a=1&b=2");
	assert(a == b);
	assert(a == "https://ex.com/a?a=1&b=2");
	std::cout << "✓ test_equivalent_urls_share_a_key\n";
}

void test_tracking_params_dropped() {
	assert(UrlCanonicalizer::normalizeForKey("https://ex.com/p?utm_source=x&id=5") == "https://ex.com/p?id=5");
	assert(UrlCanonicalizer::normalizeForKey("https://ex.com/p?UTM_Medium=x&gclid=1&fbclid=2") == "https://ex.com/p");
	assert(UrlCanonicalizer::normalizeForKey("https://ex.com/p?igshid=1&mc_cid=2&mc_eid=3&q=a") == "https://ex.com/p?q=a");
	assert(UrlCanonicalizer::normalizeForKey("https://ex.com/p?") == "https://ex.com/p");
	std::cout << "✓ test_tracking_params_dropped\n";
}

void test_paths_cleaned() {
	assert(UrlCanonicalizer::normalizeForKey("https://ex.com/blog/index.html") == "https://ex.com/blog");
	assert(UrlCanonicalizer::normalizeForKey("https://ex.com/index.php") == "https://ex.com/");
	assert(UrlCanonicalizer::normalizeForKey("https://ex.com//a//b/") == "https://ex.com/a/b");
	assert(UrlCanonicalizer::normalizeForKey("https://ex.com/") == "https://ex.com/");
	assert(UrlCanonicalizer::normalizeForKey("https://user:pw@ex.com/x") == "https://ex.com/x");
	std::cout << "✓ test_paths_cleaned\n";
}

void test_host_and_scheme_kept() {
	assert(UrlCanonicalizer::normalizeForKey("https://www.ex.com/") == "https://www.ex.com/");
	assert(UrlCanonicalizer::normalizeForKey("http://ex.com/") == "http://ex.com/");
	std::cout << "✓ test_host_and_scheme_kept\n";
}

void test_invalid_input_passes_through() {
	assert(UrlCanonicalizer::normalizeForKey("not a url") == "not a url");
	assert(UrlCanonicalizer::normalizeForKey("") == "");
	std::cout << "✓ test_invalid_input_passes_through\n";
}

void test_idempotent() {
	const char* inputs[] = {
		"https://EX.com/a/?b=2&a=1#frag",
		"https://ex.com/shop/index.html?utm_campaign=x&z=1&a=2",
		"https://ex.com//deep//path/",
		"https://ex.com/a b/c?q=hello world",
		"mailto:someone@example.com",
		"garbage",
	};
	for (const char* input : inputs) {
		std::string once = UrlCanonicalizer::normalizeForKey(input);
		assert(UrlCanonicalizer::normalizeForKey(once) == once);
	}
	std::cout << "✓ test_idempotent\n";
}

void test_internality() {
	std::string base = "https://shop.example.com";
	assert(UrlCanonicalizer::isInternal(base, "https://shop.example.com/x", false));
	assert(UrlCanonicalizer::isInternal(base, "https://SHOP.example.com/x", false));
	assert(!UrlCanonicalizer::isInternal(base, "https://blog.example.com/x", false));
	assert(UrlCanonicalizer::isInternal(base, "https://blog.example.com/x", true));
	assert(!UrlCanonicalizer::isInternal(base, "https://example.org/x", true));
	assert(!UrlCanonicalizer::isInternal(base, "not a url", true));
	std::cout << "✓ test_internality\n";
}

void test_www_counterpart() {
	assert(UrlCanonicalizer::wwwCounterpart("https://example.com/x") == std::string("https://www.example.com/x"));
	assert(UrlCanonicalizer::wwwCounterpart("https://www.example.com/") == std::string("https://example.com/"));
	assert(!UrlCanonicalizer::wwwCounterpart("nope"));
	std::cout << "✓ test_www_counterpart\n";
}

void test_ignored_extensions() {
	UrlCanonicalizer canonicalizer(IgnoreList({ "pdf", "tar.gz", ".zip" }));
	assert(canonicalizer.hasIgnoredExtension("https://ex.com/doc.PDF"));
	assert(canonicalizer.hasIgnoredExtension("https://ex.com/file.pdf?x=1"));
	assert(canonicalizer.hasIgnoredExtension("https://ex.com/a.tar.gz"));
	assert(canonicalizer.hasIgnoredExtension("https://ex.com/a.zip"));
	assert(!canonicalizer.hasIgnoredExtension("https://ex.com/pdf"));
	assert(!canonicalizer.hasIgnoredExtension("https://ex.com/.pdf"));
	assert(!canonicalizer.hasIgnoredExtension("https://ex.com/a.tar.bz2"));
	assert(!canonicalizer.hasIgnoredExtension("https://ex.com/page.html"));

	UrlCanonicalizer singleOnly(IgnoreList({ "pdf" }));
	assert(!singleOnly.hasIgnoredExtension("https://ex.com/a.tar.gz"));

	UrlCanonicalizer nothing;
	assert(!nothing.hasIgnoredExtension("https://ex.com/doc.pdf"));
	std::cout << "✓ test_ignored_extensions\n";
}

void test_ignore_list_file() {
	auto path = std::filesystem::temp_directory_path() / "seocrawler_test_ignore.txt";
	{
		std::ofstream file(path);
		file << " PDF \n\n zip\r\n";
	}
	IgnoreList list = IgnoreList::fromFile(path.string());
	assert(list.size() == 2);
	assert(list.contains("pdf"));
	assert(list.contains("zip"));
	std::filesystem::remove(path);

	IgnoreList missing = IgnoreList::fromFile("/nonexistent/seocrawler/ignore.txt");
	assert(missing.empty());
	std::cout << "✓ test_ignore_list_file\n";
}

int main() {
	std::cout << "Running UrlCanonicalizer tests...\n\n";

	test_equivalent_urls_share_a_key();
	test_tracking_params_dropped();
	test_paths_cleaned();
	test_host_and_scheme_kept();
	test_invalid_input_passes_through();
	test_idempotent();
	test_internality();
	test_www_counterpart();
	test_ignored_extensions();
	test_ignore_list_file();

	std::cout << "\nAll tests passed!\n";
	return 0;
}
