#include "seocrawler/RobotsDirectives.h"

#include <algorithm>
#include <cctype>

namespace seocrawler {

	namespace {

		std::optional<bool> orAsserted(const std::optional<bool>& a, const std::optional<bool>& b) {
			if (!a && !b)
				return std::nullopt;
			return a.value_or(false) || b.value_or(false);
		}

		void applyToken(RobotsDirectives& directives, const std::string& token) {
			if (token == "noindex")
				directives.noindex = true;
			else if (token == "nofollow")
				directives.nofollow = true;
			else if (token == "noarchive")
				directives.noarchive = true;
			else if (token == "nosnippet")
				directives.nosnippet = true;
			else if (token == "noimageindex")
				directives.noimageindex = true;
			else if (token == "nocache")
				directives.nocache = true;
		}

	}

	std::optional<RobotsDirectives> RobotsDirectives::parse(const std::string& raw) {
		if (std::all_of(raw.begin(), raw.end(), [](unsigned char c) { return std::isspace(c); }))
			return std::nullopt;

		RobotsDirectives directives;
		std::string token;
		auto flush = [&]() {
			size_t start = token.find_first_not_of(" \t\r\n");
			if (start != std::string::npos) {
				size_t end = token.find_last_not_of(" \t\r\n");
				std::string cleaned = token.substr(start, end - start + 1);
				std::transform(cleaned.begin(), cleaned.end(), cleaned.begin(), [](unsigned char c) { return std::tolower(c); });
				applyToken(directives, cleaned);
			}
			token.clear();
		};

		for (char c : raw) {
			if (c == ',' || c == ';')
				flush();
			else
				token.push_back(c);
		}
		flush();
		return directives;
	}

	std::optional<RobotsDirectives> RobotsDirectives::merge(const std::optional<RobotsDirectives>& a,
		const std::optional<RobotsDirectives>& b) {
		if (!a)
			return b;
		if (!b)
			return a;

		RobotsDirectives merged;
		merged.noindex = orAsserted(a->noindex, b->noindex);
		merged.nofollow = orAsserted(a->nofollow, b->nofollow);
		merged.noarchive = orAsserted(a->noarchive, b->noarchive);
		merged.nosnippet = orAsserted(a->nosnippet, b->nosnippet);
		merged.noimageindex = orAsserted(a->noimageindex, b->noimageindex);
		merged.nocache = orAsserted(a->nocache, b->nocache);
		return merged;
	}

}
