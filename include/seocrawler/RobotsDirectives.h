#pragma once

#include <optional>
#include <string>

namespace seocrawler {

	//indexing directives of a meta robots tag or X-Robots-Tag header;
	//an empty optional means "not asserted", never "asserted false"
	struct RobotsDirectives {
		std::optional<bool> noindex;
		std::optional<bool> nofollow;
		std::optional<bool> noarchive;
		std::optional<bool> nosnippet;
		std::optional<bool> noimageindex;
		std::optional<bool> nocache;

		//comma / semicolon separated tokens; unknown ones (max-snippet:-1, all) are ignored.
		//nullopt for an empty or blank value
		static std::optional<RobotsDirectives> parse(const std::string& raw);

		//per directive OR over whatever either side asserts
		static std::optional<RobotsDirectives> merge(const std::optional<RobotsDirectives>& a,
			const std::optional<RobotsDirectives>& b);

		bool isNoindex() const { return noindex.value_or(false); }

		bool operator==(const RobotsDirectives& other) const {
			return noindex == other.noindex && nofollow == other.nofollow && noarchive == other.noarchive
				&& nosnippet == other.nosnippet && noimageindex == other.noimageindex && nocache == other.nocache;
		}
		bool operator!=(const RobotsDirectives& other) const { return !(*this == other); }
	};

}
