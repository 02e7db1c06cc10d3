#include "seocrawler/Sitemap.h"

#include "seocrawler/Errors.h"
#include "seocrawler/Link.h"
#include "seocrawler/Log.h"

#include <algorithm>
#include <climits>
#include <libxml/parser.h>
#include <libxml/tree.h>

namespace seocrawler {

	namespace {

		//RAII wrapper for xmlDoc
		class XmlDocGuard {
		public:
			explicit XmlDocGuard(xmlDocPtr doc) : m_doc(doc) {}
			~XmlDocGuard() {
				if (m_doc)
					xmlFreeDoc(m_doc);
			}
			XmlDocGuard(const XmlDocGuard&) = delete;
			XmlDocGuard& operator=(const XmlDocGuard&) = delete;

			xmlDocPtr get() const { return m_doc; }
			explicit operator bool() const { return m_doc != nullptr; }

		private:
			xmlDocPtr m_doc;
		};

		bool isElement(xmlNodePtr node, const char* name) {
			return node->type == XML_ELEMENT_NODE && xmlStrcmp(node->name, BAD_CAST name) == 0;
		}

		std::string trimmedContent(xmlNodePtr node) {
			xmlChar* content = xmlNodeGetContent(node);
			if (!content)
				return "";
			std::string value(reinterpret_cast<char*>(content));
			xmlFree(content);

			size_t start = value.find_first_not_of(" \t\r\n");
			if (start == std::string::npos)
				return "";
			size_t end = value.find_last_not_of(" \t\r\n");
			return value.substr(start, end - start + 1);
		}

		//<entry><loc>...</loc></entry> under the root
		std::vector<std::string> childLocations(xmlNodePtr root, const char* entryName) {
			std::vector<std::string> locations;
			for (xmlNodePtr entry = root->children; entry; entry = entry->next) {
				if (!isElement(entry, entryName))
					continue;
				for (xmlNodePtr field = entry->children; field; field = field->next) {
					if (!isElement(field, "loc"))
						continue;
					std::string loc = trimmedContent(field);
					if (!loc.empty())
						locations.push_back(loc);
					break;
				}
			}
			return locations;
		}

	}

	std::vector<std::string> SitemapResolver::discoverSitemapEndpoints(const std::string& startUrl,
		const std::vector<std::string>& robotsSitemaps) {
		std::vector<std::string> endpoints;
		auto addUnique = [&endpoints](const std::string& endpoint) {
			if (std::find(endpoints.begin(), endpoints.end(), endpoint) == endpoints.end())
				endpoints.push_back(endpoint);
		};

		for (const auto& sitemap : robotsSitemaps)
			addUnique(sitemap);

		if (auto start = Link::parse(startUrl); start && !start->getHost().empty())
			addUnique(start->getOrigin() + "/sitemap.xml");

		return endpoints;
	}

	std::vector<std::string> SitemapResolver::collectSitemapUrls(const std::string& endpoint,
		const std::string& userAgent, size_t limit) const {
		std::unordered_set<std::string> expanded;
		return collect(endpoint, userAgent, limit, expanded);
	}

	std::vector<std::string> SitemapResolver::collect(const std::string& endpoint, const std::string& userAgent,
		size_t remaining, std::unordered_set<std::string>& expanded) const {
		std::vector<std::string> urls;
		if (remaining == 0)
			return urls;
		//an index listing itself (or a cycle of indexes) is expanded once
		if (!expanded.insert(endpoint).second)
			return urls;

		FetchResult result;
		try {
			result = m_fetcher.fetchChain(endpoint, userAgent);
		}
		catch (const FetchError& ex) {
			log::warn("Failed to fetch sitemap ", endpoint, ": ", ex.what());
			return urls;
		}

		if (!result.response.ok()) {
			log::debug("Sitemap ", endpoint, " answered with status ", result.response.statusCode);
			return urls;
		}

		auto document = parse(result.response.text);
		if (!document) {
			log::warn("Sitemap ", endpoint, " is not a valid sitemap document");
			return urls;
		}

		if (document->isIndex) {
			for (const auto& child : document->locations) {
				if (urls.size() >= remaining)
					break;
				auto childUrls = collect(child, userAgent, remaining - urls.size(), expanded);
				for (auto& url : childUrls) {
					if (urls.size() >= remaining)
						break;
					urls.push_back(std::move(url));
				}
			}
			return urls;
		}

		for (auto& loc : document->locations) {
			if (urls.size() >= remaining)
				break;
			urls.push_back(std::move(loc));
		}
		return urls;
	}

	std::optional<SitemapDocument> SitemapResolver::parse(const std::string& xml) {
		if (xml.empty() || xml.size() > static_cast<size_t>(INT_MAX))
			return std::nullopt;

		XmlDocGuard doc(xmlReadMemory(xml.c_str(), static_cast<int>(xml.size()), "sitemap.xml", nullptr,
			XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING));
		if (!doc)
			return std::nullopt;

		xmlNodePtr root = xmlDocGetRootElement(doc.get());
		if (!root)
			return std::nullopt;

		SitemapDocument document;
		if (isElement(root, "sitemapindex")) {
			document.isIndex = true;
			document.locations = childLocations(root, "sitemap");
		}
		else if (isElement(root, "urlset")) {
			document.locations = childLocations(root, "url");
		}
		else {
			return std::nullopt;
		}
		return document;
	}

}
