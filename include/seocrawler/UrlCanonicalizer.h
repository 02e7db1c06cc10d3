#pragma once

#include "seocrawler/Link.h"

#include <optional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace seocrawler {

	//lower-cased file extensions the crawler never fetches ("pdf", ".zip", "tar.gz")
	class IgnoreList {
	public:
		IgnoreList() = default;
		explicit IgnoreList(const std::vector<std::string>& extensions);

		//one extension per line; a missing or unreadable file yields an empty list
		static IgnoreList fromFile(const std::string& path);

		bool contains(const std::string& extension) const {
			return m_extensions.count(extension) != 0;
		}

		bool empty() const { return m_extensions.empty(); }
		size_t size() const { return m_extensions.size(); }

	private:
		void add(std::string extension);

		std::unordered_set<std::string> m_extensions;
	};

	class UrlCanonicalizer {
	public:
		explicit UrlCanonicalizer(IgnoreList ignoreList = IgnoreList()) : m_ignoreList(std::move(ignoreList)) {}

		//stable dedup key; strings that do not parse as urls come back unchanged
		static std::string normalizeForKey(const std::string& url);

		//naive eTLD+1 comparison (last two host labels)
		static bool sameETLD1(const Link& a, const Link& b);

		static bool isInternal(const Link& base, const Link& target, bool includeSubdomains);

		//false when either side does not parse
		static bool isInternal(const std::string& base, const std::string& target, bool includeSubdomains);

		//same url on the www. / non-www. sibling host, nullopt for unparseable input
		static std::optional<std::string> wwwCounterpart(const std::string& url);

		bool hasIgnoredExtension(const Link& url) const;
		bool hasIgnoredExtension(const std::string& url) const;

		const IgnoreList& getIgnoreList() const { return m_ignoreList; }

	private:
		IgnoreList m_ignoreList;
	};

}
