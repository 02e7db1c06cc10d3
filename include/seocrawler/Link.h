#pragma once

#include <optional>
#include <string>

namespace seocrawler {

	//parsed absolute url, host lower-cased, default port dropped, dot segments removed
	class Link {
	public:
		//nullopt when the string is not an absolute url
		static std::optional<Link> parse(const std::string& url);

		//resolve an href against a base url, nullopt when it cannot be resolved
		static std::optional<Link> resolve(const Link& base, const std::string& reference);

		//string convenience around resolve
		static std::optional<std::string> absolutize(const std::string& base, const std::string& href);

		//getters
		const std::string& getScheme() const { return m_scheme; }
		const std::string& getHost() const { return m_host; }
		const std::string& getPort() const { return m_port; }
		const std::string& getPath() const { return m_path; }
		const std::string& getQuery() const { return m_query; }
		const std::string& getFragment() const { return m_fragment; }
		bool hasQuery() const { return m_hasQuery; }
		bool hasFragment() const { return m_hasFragment; }

		bool isHttp() const { return m_scheme == "http" || m_scheme == "https"; }

		//naive eTLD+1: the last two dot separated labels of the host
		std::string getDomain() const;

		//scheme://host[:port]
		std::string getOrigin() const;

		//path plus query, what robots.txt rules are matched against
		std::string getRelativePath() const;

		std::string getFullLink() const;

		//setters, each keeps the link serializable
		void setHost(const std::string& host);
		void setPath(const std::string& path);
		void setQuery(const std::string& query);
		void clearQuery();
		void clearFragment();
		void clearUserInfo() { m_userInfo.clear(); }

		bool operator==(const Link& other) const { return getFullLink() == other.getFullLink(); }
		bool operator!=(const Link& other) const { return !(*this == other); }

	private:
		Link() = default;

		static std::string removeDotSegments(const std::string& path);

		std::string m_scheme;
		std::string m_userInfo;
		std::string m_host;
		std::string m_port;
		std::string m_path;
		std::string m_query;
		std::string m_fragment;
		bool m_hasQuery = false;
		bool m_hasFragment = false;
		//mailto:, javascript:, data: ... no authority, path holds the rest
		bool m_opaque = false;
	};

}
