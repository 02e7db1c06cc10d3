#include "seocrawler/UrlCanonicalizer.h"

#include "seocrawler/Log.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <regex>

namespace seocrawler {

	namespace {

		const std::unordered_set<std::string> TRACKING_PARAMS = {
			"gclid", "fbclid", "igshid", "mc_cid", "mc_eid",
		};

		const char* const COMPOUND_EXTENSIONS[] = { "tar.gz", "tar.bz2", "tar.xz" };

		std::string toLower(std::string value) {
			std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return std::tolower(c); });
			return value;
		}

		bool endsWith(const std::string& value, const std::string& suffix) {
			return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
		}

		bool isTrackingParam(const std::string& name) {
			if (TRACKING_PARAMS.count(name) != 0)
				return true;
			return toLower(name).rfind("utm_", 0) == 0;
		}

		std::string paramName(const std::string& pair) {
			return pair.substr(0, pair.find('='));
		}

		//drop tracking params, sort the rest by name (stable for repeated names)
		std::string cleanQuery(const std::string& query) {
			std::vector<std::string> params;
			size_t start = 0;
			while (start <= query.size()) {
				size_t amp = query.find('&', start);
				std::string pair = query.substr(start, amp == std::string::npos ? std::string::npos : amp - start);
				if (!pair.empty() && !isTrackingParam(paramName(pair)))
					params.push_back(pair);
				if (amp == std::string::npos)
					break;
				start = amp + 1;
			}

			std::stable_sort(params.begin(), params.end(), [](const std::string& a, const std::string& b) {
				return paramName(a) < paramName(b);
			});

			std::string out;
			for (const auto& param : params) {
				if (!out.empty())
					out += '&';
				out += param;
			}
			return out;
		}

		std::string collapseSlashes(const std::string& path) {
			std::string out;
			out.reserve(path.size());
			for (char c : path) {
				if (c == '/' && !out.empty() && out.back() == '/')
					continue;
				out.push_back(c);
			}
			return out;
		}

		void stripTrailingSlash(std::string& path) {
			if (path.size() > 1 && path.back() == '/')
				path.pop_back();
		}

		//index.html, index.php, ... as the last path segment
		std::string removeDirectoryIndex(std::string path) {
			static const std::regex directoryIndex("^index\\.[a-z]+$", std::regex::icase);
			for (;;) {
				stripTrailingSlash(path);
				size_t slash = path.rfind('/');
				if (slash == std::string::npos)
					return path;
				if (!std::regex_match(path.substr(slash + 1), directoryIndex))
					return path;
				path.erase(slash + 1);
			}
		}

	}

	IgnoreList::IgnoreList(const std::vector<std::string>& extensions) {
		for (const auto& extension : extensions)
			add(extension);
	}

	IgnoreList IgnoreList::fromFile(const std::string& path) {
		IgnoreList list;
		std::ifstream file(path);
		if (!file.is_open()) {
			log::warn("Ignore list not found, nothing will be skipped: ", path);
			return list;
		}

		for (std::string line; std::getline(file, line);)
			list.add(line);

		log::debug("Loaded ", list.size(), " ignored extensions from ", path);
		return list;
	}

	void IgnoreList::add(std::string extension) {
		auto notSpace = [](unsigned char c) { return !std::isspace(c); };
		extension.erase(extension.begin(), std::find_if(extension.begin(), extension.end(), notSpace));
		extension.erase(std::find_if(extension.rbegin(), extension.rend(), notSpace).base(), extension.end());
		if (extension.empty())
			return;
		m_extensions.insert(toLower(extension));
	}

	std::string UrlCanonicalizer::normalizeForKey(const std::string& url) {
		auto parsed = Link::parse(url);
		if (!parsed)
			return url;

		Link link = *parsed;
		link.clearFragment();
		link.clearUserInfo();

		if (!link.getHost().empty()) {
			std::string path = removeDirectoryIndex(collapseSlashes(link.getPath()));
			link.setPath(path);
		}

		if (link.hasQuery()) {
			std::string query = cleanQuery(link.getQuery());
			if (query.empty())
				link.clearQuery();
			else
				link.setQuery(query);
		}

		return link.getFullLink();
	}

	bool UrlCanonicalizer::sameETLD1(const Link& a, const Link& b) {
		return a.getDomain() == b.getDomain();
	}

	bool UrlCanonicalizer::isInternal(const Link& base, const Link& target, bool includeSubdomains) {
		if (!sameETLD1(base, target))
			return false;
		if (!includeSubdomains)
			return base.getHost() == target.getHost();
		return true;
	}

	bool UrlCanonicalizer::isInternal(const std::string& base, const std::string& target, bool includeSubdomains) {
		auto baseLink = Link::parse(base);
		auto targetLink = Link::parse(target);
		if (!baseLink || !targetLink)
			return false;
		return isInternal(*baseLink, *targetLink, includeSubdomains);
	}

	std::optional<std::string> UrlCanonicalizer::wwwCounterpart(const std::string& url) {
		auto parsed = Link::parse(url);
		if (!parsed || parsed->getHost().empty())
			return std::nullopt;

		Link link = *parsed;
		const std::string& host = link.getHost();
		if (host.rfind("www.", 0) == 0)
			link.setHost(host.substr(4));
		else
			link.setHost("www." + host);
		return link.getFullLink();
	}

	bool UrlCanonicalizer::hasIgnoredExtension(const Link& url) const {
		if (m_ignoreList.empty())
			return false;

		std::string path = toLower(url.getPath());

		for (const char* compound : COMPOUND_EXTENSIONS) {
			std::string extension(compound);
			if (endsWith(path, "." + extension) && (m_ignoreList.contains(extension) || m_ignoreList.contains("." + extension)))
				return true;
		}

		std::string basename = path.substr(path.rfind('/') + 1);
		size_t dot = basename.rfind('.');
		//".htaccess" has no extension
		if (dot == std::string::npos || dot == 0)
			return false;

		std::string withDot = basename.substr(dot);
		std::string withoutDot = withDot.substr(1);
		if (withoutDot.empty())
			return false;
		return m_ignoreList.contains(withoutDot) || m_ignoreList.contains(withDot);
	}

	bool UrlCanonicalizer::hasIgnoredExtension(const std::string& url) const {
		auto parsed = Link::parse(url);
		if (!parsed)
			return false;
		return hasIgnoredExtension(*parsed);
	}

}
