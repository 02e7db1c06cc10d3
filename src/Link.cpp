#include "seocrawler/Link.h"

#include <algorithm>
#include <cctype>
#include <cstring>

namespace seocrawler {

	namespace {

		bool isSpecial(const std::string& scheme) {
			return scheme == "http" || scheme == "https" || scheme == "ws" || scheme == "wss" || scheme == "ftp";
		}

		std::string defaultPort(const std::string& scheme) {
			if (scheme == "http" || scheme == "ws")
				return "80";
			if (scheme == "https" || scheme == "wss")
				return "443";
			if (scheme == "ftp")
				return "21";
			return "";
		}

		std::string toLower(std::string value) {
			std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return std::tolower(c); });
			return value;
		}

		bool startsWith(const std::string& value, const char* prefix) {
			return value.rfind(prefix, 0) == 0;
		}

		//trim c0 controls and spaces, drop embedded tabs and newlines
		std::string cleanInput(const std::string& input) {
			size_t start = 0;
			size_t end = input.size();
			while (start < end && static_cast<unsigned char>(input[start]) <= 0x20)
				++start;
			while (end > start && static_cast<unsigned char>(input[end - 1]) <= 0x20)
				--end;

			std::string out;
			out.reserve(end - start);
			for (size_t i = start; i < end; ++i) {
				char c = input[i];
				if (c == '\t' || c == '\n' || c == '\r')
					continue;
				out.push_back(c);
			}
			return out;
		}

		//length of a leading "scheme:" or 0 when there is none
		size_t schemeLength(const std::string& value) {
			if (value.empty() || !std::isalpha(static_cast<unsigned char>(value[0])))
				return 0;
			for (size_t i = 1; i < value.size(); ++i) {
				char c = value[i];
				if (c == ':')
					return i;
				if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.'))
					return 0;
			}
			return 0;
		}

		void appendEscaped(std::string& out, unsigned char c) {
			static const char* hex = "0123456789ABCDEF";
			out.push_back('%');
			out.push_back(hex[c >> 4]);
			out.push_back(hex[c & 0x0F]);
		}

		//'%' is never escaped so encoding an encoded string is a no-op
		std::string encodeComponent(const std::string& value, const char* extra) {
			std::string out;
			out.reserve(value.size());
			for (char ch : value) {
				unsigned char c = static_cast<unsigned char>(ch);
				if (c <= 0x20 || c >= 0x7F || std::strchr(extra, ch) != nullptr)
					appendEscaped(out, c);
				else
					out.push_back(ch);
			}
			return out;
		}

		std::string encodePath(const std::string& value) {
			return encodeComponent(value, "\"<>`{}");
		}

		std::string encodeQuery(const std::string& value) {
			return encodeComponent(value, "\"<>");
		}

		std::string encodeFragment(const std::string& value) {
			return encodeComponent(value, "\"<>`");
		}

		bool validHost(const std::string& host) {
			if (host.empty())
				return false;
			if (host.front() == '[')
				return host.back() == ']';
			for (char ch : host) {
				unsigned char c = static_cast<unsigned char>(ch);
				if (c <= 0x20 || c == 0x7F)
					return false;
				if (std::strchr("#/:<>?@[\\]^|", ch) != nullptr)
					return false;
			}
			return true;
		}

		struct Reference {
			std::string path;
			std::string query;
			std::string fragment;
			bool hasQuery = false;
			bool hasFragment = false;
		};

		Reference splitReference(std::string rest) {
			Reference ref;
			size_t hash = rest.find('#');
			if (hash != std::string::npos) {
				ref.fragment = rest.substr(hash + 1);
				ref.hasFragment = true;
				rest.erase(hash);
			}
			size_t question = rest.find('?');
			if (question != std::string::npos) {
				ref.query = rest.substr(question + 1);
				ref.hasQuery = true;
				rest.erase(question);
			}
			ref.path = rest;
			return ref;
		}

	}

	std::optional<Link> Link::parse(const std::string& url) {
		std::string input = cleanInput(url);
		size_t length = schemeLength(input);
		if (length == 0)
			return std::nullopt;

		Link link;
		link.m_scheme = toLower(input.substr(0, length));
		std::string rest = input.substr(length + 1);
		bool special = isSpecial(link.m_scheme);
		if (special)
			std::replace(rest.begin(), rest.end(), '\\', '/');

		if (!startsWith(rest, "//")) {
			//http:foo without a base is not something we crawl
			if (special)
				return std::nullopt;
			Reference ref = splitReference(rest);
			link.m_opaque = true;
			link.m_path = ref.path;
			link.m_query = ref.query;
			link.m_hasQuery = ref.hasQuery;
			link.m_fragment = ref.fragment;
			link.m_hasFragment = ref.hasFragment;
			return link;
		}

		rest.erase(0, 2);
		if (special) {
			size_t firstNonSlash = rest.find_first_not_of('/');
			rest.erase(0, firstNonSlash == std::string::npos ? rest.size() : firstNonSlash);
		}

		size_t authorityEnd = rest.find_first_of("/?#");
		std::string authority = rest.substr(0, authorityEnd);
		std::string tail = authorityEnd == std::string::npos ? "" : rest.substr(authorityEnd);

		size_t at = authority.rfind('@');
		if (at != std::string::npos) {
			link.m_userInfo = authority.substr(0, at);
			authority.erase(0, at + 1);
		}

		std::string host;
		std::string port;
		if (!authority.empty() && authority.front() == '[') {
			size_t close = authority.find(']');
			if (close == std::string::npos)
				return std::nullopt;
			host = authority.substr(0, close + 1);
			std::string after = authority.substr(close + 1);
			if (!after.empty()) {
				if (after.front() != ':')
					return std::nullopt;
				port = after.substr(1);
			}
		}
		else {
			size_t colon = authority.rfind(':');
			if (colon != std::string::npos) {
				host = authority.substr(0, colon);
				port = authority.substr(colon + 1);
			}
			else {
				host = authority;
			}
		}

		if (!port.empty()) {
			if (!std::all_of(port.begin(), port.end(), [](unsigned char c) { return std::isdigit(c); }))
				return std::nullopt;
			size_t firstNonZero = port.find_first_not_of('0');
			port = firstNonZero == std::string::npos ? "0" : port.substr(firstNonZero);
			if (port.size() > 5 || std::stol(port) > 65535)
				return std::nullopt;
			if (port == defaultPort(link.m_scheme))
				port.clear();
		}

		host = toLower(host);
		if (host.empty()) {
			if (special)
				return std::nullopt;
		}
		else if (!validHost(host)) {
			return std::nullopt;
		}
		link.m_host = host;
		link.m_port = port;

		Reference ref = splitReference(tail);
		std::string path = removeDotSegments(ref.path);
		if (path.empty() && special)
			path = "/";
		link.m_path = encodePath(path);
		link.m_query = encodeQuery(ref.query);
		link.m_hasQuery = ref.hasQuery;
		link.m_fragment = encodeFragment(ref.fragment);
		link.m_hasFragment = ref.hasFragment;
		return link;
	}

	std::optional<Link> Link::resolve(const Link& base, const std::string& reference) {
		std::string input = cleanInput(reference);
		bool special = isSpecial(base.m_scheme);

		size_t length = schemeLength(input);
		if (length != 0) {
			std::string scheme = toLower(input.substr(0, length));
			std::string rest = input.substr(length + 1);
			if (special)
				std::replace(rest.begin(), rest.end(), '\\', '/');
			//"http:page" relative to an http base keeps the base authority
			if (scheme != base.m_scheme || !special || startsWith(rest, "//") || base.m_opaque)
				return parse(input);
			input = rest;
		}

		if (base.m_opaque)
			return std::nullopt;
		if (special)
			std::replace(input.begin(), input.end(), '\\', '/');
		if (startsWith(input, "//"))
			return parse(base.m_scheme + ":" + input);

		Reference ref = splitReference(input);
		Link out = base;
		out.m_fragment.clear();
		out.m_hasFragment = false;

		if (ref.path.empty()) {
			if (ref.hasQuery) {
				out.m_query = encodeQuery(ref.query);
				out.m_hasQuery = true;
			}
		}
		else {
			out.m_query = encodeQuery(ref.query);
			out.m_hasQuery = ref.hasQuery;
			std::string merged;
			if (ref.path.front() == '/') {
				merged = ref.path;
			}
			else {
				size_t slash = base.m_path.rfind('/');
				merged = (slash == std::string::npos ? "/" : base.m_path.substr(0, slash + 1)) + ref.path;
			}
			out.m_path = encodePath(removeDotSegments(merged));
			if (out.m_path.empty())
				out.m_path = "/";
		}

		if (ref.hasFragment) {
			out.m_fragment = encodeFragment(ref.fragment);
			out.m_hasFragment = true;
		}
		return out;
	}

	std::optional<std::string> Link::absolutize(const std::string& base, const std::string& href) {
		auto baseLink = parse(base);
		if (!baseLink)
			return std::nullopt;
		auto resolved = resolve(*baseLink, href);
		if (!resolved)
			return std::nullopt;
		return resolved->getFullLink();
	}

	std::string Link::getDomain() const {
		if (m_host.empty() || m_host.front() == '[')
			return m_host;
		size_t last = m_host.rfind('.');
		if (last == std::string::npos || last == 0)
			return m_host;
		size_t previous = m_host.rfind('.', last - 1);
		if (previous == std::string::npos)
			return m_host;
		return m_host.substr(previous + 1);
	}

	std::string Link::getOrigin() const {
		std::string origin = m_scheme + "://" + m_host;
		if (!m_port.empty())
			origin += ":" + m_port;
		return origin;
	}

	std::string Link::getRelativePath() const {
		if (m_hasQuery)
			return m_path + "?" + m_query;
		return m_path;
	}

	std::string Link::getFullLink() const {
		std::string out = m_scheme + ":";
		if (!m_opaque) {
			out += "//";
			if (!m_userInfo.empty())
				out += m_userInfo + "@";
			out += m_host;
			if (!m_port.empty())
				out += ":" + m_port;
		}
		out += m_path;
		if (m_hasQuery)
			out += "?" + m_query;
		if (m_hasFragment)
			out += "#" + m_fragment;
		return out;
	}

	void Link::setHost(const std::string& host) {
		m_host = toLower(host);
	}

	void Link::setPath(const std::string& path) {
		m_path = encodePath(path);
		if (m_path.empty() && !m_opaque && isSpecial(m_scheme))
			m_path = "/";
	}

	void Link::setQuery(const std::string& query) {
		m_query = encodeQuery(query);
		m_hasQuery = true;
	}

	void Link::clearQuery() {
		m_query.clear();
		m_hasQuery = false;
	}

	void Link::clearFragment() {
		m_fragment.clear();
		m_hasFragment = false;
	}

	std::string Link::removeDotSegments(const std::string& path) {
		std::string input = path;
		std::string output;

		auto popSegment = [&output]() {
			size_t slash = output.rfind('/');
			output.erase(slash == std::string::npos ? 0 : slash);
		};

		while (!input.empty()) {
			if (startsWith(input, "../")) {
				input.erase(0, 3);
			}
			else if (startsWith(input, "./")) {
				input.erase(0, 2);
			}
			else if (startsWith(input, "/./")) {
				input.replace(0, 3, "/");
			}
			else if (input == "/.") {
				input = "/";
			}
			else if (startsWith(input, "/../")) {
				input.replace(0, 4, "/");
				popSegment();
			}
			else if (input == "/..") {
				input = "/";
				popSegment();
			}
			else if (input == "." || input == "..") {
				input.clear();
			}
			else {
				size_t next = input.find('/', input.front() == '/' ? 1 : 0);
				std::string segment = input.substr(0, next);
				output += segment;
				input.erase(0, segment.size());
			}
		}
		return output;
	}

}
