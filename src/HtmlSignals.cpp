#include "seocrawler/HtmlSignals.h"

#include <algorithm>
#include <cctype>
#include <climits>
#include <libxml/HTMLparser.h>
#include <libxml/tree.h>
#include <sstream>

namespace seocrawler {

	namespace {

		//RAII wrapper for the html document
		class HtmlDocGuard {
		public:
			explicit HtmlDocGuard(htmlDocPtr doc) : m_doc(doc) {}
			~HtmlDocGuard() {
				if (m_doc)
					xmlFreeDoc(m_doc);
			}
			HtmlDocGuard(const HtmlDocGuard&) = delete;
			HtmlDocGuard& operator=(const HtmlDocGuard&) = delete;

			htmlDocPtr get() const { return m_doc; }
			explicit operator bool() const { return m_doc != nullptr; }

		private:
			htmlDocPtr m_doc;
		};

		std::string toLower(std::string value) {
			std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return std::tolower(c); });
			return value;
		}

		std::string trim(const std::string& value) {
			size_t start = value.find_first_not_of(" \t\r\n\f");
			if (start == std::string::npos)
				return "";
			size_t end = value.find_last_not_of(" \t\r\n\f");
			return value.substr(start, end - start + 1);
		}

		bool hasPrefix(const std::string& value, const char* prefix) {
			return toLower(value.substr(0, std::char_traits<char>::length(prefix))) == prefix;
		}

		std::string getAttribute(xmlNodePtr node, const char* attr) {
			xmlChar* value = xmlGetProp(node, BAD_CAST attr);
			if (!value)
				return "";
			std::string result(reinterpret_cast<char*>(value));
			xmlFree(value);
			return result;
		}

		bool hasAttribute(xmlNodePtr node, const char* attr) {
			return xmlHasProp(node, BAD_CAST attr) != nullptr;
		}

		//rel="alternate stylesheet" carries several tokens
		bool relContains(xmlNodePtr node, const std::string& token) {
			std::istringstream rel(toLower(getAttribute(node, "rel")));
			for (std::string part; rel >> part;) {
				if (part == token)
					return true;
			}
			return false;
		}

		void collectSignals(xmlNodePtr node, HtmlSignals& signals) {
			for (xmlNodePtr cur = node; cur; cur = cur->next) {
				if (cur->type != XML_ELEMENT_NODE)
					continue;

				if (xmlStrcasecmp(cur->name, BAD_CAST "a") == 0) {
					if (hasAttribute(cur, "href"))
						signals.anchors.push_back(getAttribute(cur, "href"));
				}
				else if (xmlStrcasecmp(cur->name, BAD_CAST "link") == 0) {
					if (relContains(cur, "canonical")) {
						signals.canonicalHrefs.push_back(getAttribute(cur, "href"));
					}
					else if (relContains(cur, "alternate") && hasAttribute(cur, "hreflang")) {
						signals.alternates.emplace_back(getAttribute(cur, "hreflang"), getAttribute(cur, "href"));
					}
				}
				else if (xmlStrcasecmp(cur->name, BAD_CAST "meta") == 0) {
					if (toLower(trim(getAttribute(cur, "name"))) == "robots")
						signals.metaRobots.push_back(getAttribute(cur, "content"));
				}

				if (cur->children)
					collectSignals(cur->children, signals);
			}
		}

	}

	std::vector<std::string> extractHrefs(const std::string& html) {
		std::vector<std::string> links;
		for (const auto& anchor : extractHtmlSignals(html).anchors) {
			std::string link = trim(anchor);
			if (link.empty() || link[0] == '#')
				continue;
			if (hasPrefix(link, "javascript:") || hasPrefix(link, "mailto:") || hasPrefix(link, "tel:"))
				continue;
			links.push_back(link);
		}
		return links;
	}

	HtmlSignals extractHtmlSignals(const std::string& html) {
		HtmlSignals signals;
		if (html.empty() || html.size() > static_cast<size_t>(INT_MAX))
			return signals;

		HtmlDocGuard doc(htmlReadMemory(html.c_str(), static_cast<int>(html.size()), nullptr, "UTF-8",
			HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING | HTML_PARSE_NONET));
		if (!doc)
			return signals;

		xmlNodePtr root = xmlDocGetRootElement(doc.get());
		if (root)
			collectSignals(root, signals);
		return signals;
	}

}
