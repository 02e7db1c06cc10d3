#include "seocrawler/Robots.h"

#include "seocrawler/Errors.h"
#include "seocrawler/Link.h"
#include "seocrawler/Log.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace seocrawler {

	namespace {

		constexpr const char* DISALLOW = "disallow";
		constexpr const char* ALLOW = "allow";
		constexpr const char* SITEMAP = "sitemap";
		constexpr const char* USERAGENT = "user-agent";
		constexpr const char* CRAWLDELAY = "crawl-delay";
		constexpr char DELIMITER = ':';

		std::string toLower(std::string value) {
			std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return std::tolower(c); });
			return value;
		}

		std::string trim(const std::string& value) {
			size_t start = value.find_first_not_of(" \t\r\n");
			if (start == std::string::npos)
				return "";
			size_t end = value.find_last_not_of(" \t\r\n");
			return value.substr(start, end - start + 1);
		}

		std::pair<std::string, std::string> splitString(const std::string& str, char delimiter) {
			size_t pos = str.find(delimiter);
			if (pos != std::string::npos)
				return { str.substr(0, pos), str.substr(pos + 1) };
			return { str, "" };
		}

		//"MyBot/1.2 (+http://...)" -> "mybot"
		std::string productToken(const std::string& userAgent) {
			std::string token = userAgent.substr(0, userAgent.find_first_of("/ "));
			return toLower(trim(token));
		}

	}

	namespace robots {

		Parser::Parser(const std::string& robotsTxtContent) {
			tokenizeInput(robotsTxtContent);
		}

		void Parser::tokenizeInput(const std::string& robotsTxtContent) {
			std::istringstream iss(robotsTxtContent);
			Group* current = nullptr;
			//consecutive user-agent lines share one group
			bool collectingAgents = false;

			for (std::string line; std::getline(iss, line);) {
				line = trim(line.substr(0, line.find('#')));
				if (line.empty())
					continue;

				auto [rawKey, rawValue] = splitString(line, DELIMITER);
				std::string key = toLower(trim(rawKey));
				std::string value = trim(rawValue);

				if (key == USERAGENT) {
					if (value.empty())
						continue;
					if (!collectingAgents) {
						m_groups.emplace_back();
						current = &m_groups.back();
					}
					current->agents.push_back(toLower(value));
					collectingAgents = true;
					continue;
				}

				collectingAgents = false;

				if (key == SITEMAP) {
					if (!value.empty())
						m_sitemaps.push_back(value);
				}
				else if (key == DISALLOW || key == ALLOW) {
					//rules before any user-agent line belong to nobody; empty disallow allows everything
					if (!current || value.empty())
						continue;
					current->rules.push_back({ value, generateRegex(value), key == ALLOW });
				}
				else if (key == CRAWLDELAY) {
					if (!current)
						continue;
					try {
						double delay = std::stod(value);
						if (delay >= 0)
							current->crawlDelay = delay;
					}
					catch (const std::invalid_argument&) {
						log::debug("Ignoring malformed crawl-delay: ", value);
					}
					catch (const std::out_of_range&) {
						log::debug("Ignoring out of range crawl-delay: ", value);
					}
				}
				else {
					log::debug("Unknown robots.txt key: ", key);
				}
			}
		}

		std::string Parser::selectAgent(const std::string& userAgent) const {
			std::string token = productToken(userAgent);

			if (!token.empty()) {
				for (const auto& group : m_groups) {
					for (const auto& agent : group.agents) {
						if (agent == token)
							return agent;
					}
				}
				//"googlebot" rules also cover "googlebot-news"
				for (const auto& group : m_groups) {
					for (const auto& agent : group.agents) {
						if (agent != "*" && token.rfind(agent, 0) == 0)
							return agent;
					}
				}
			}

			for (const auto& group : m_groups) {
				if (std::find(group.agents.begin(), group.agents.end(), "*") != group.agents.end())
					return "*";
			}
			return "";
		}

		bool Parser::checkUrl(const std::string& path, const std::string& userAgent) const {
			if (path == "/robots.txt")
				return true;

			std::string agent = selectAgent(userAgent);
			if (agent.empty())
				return true;

			const Rule* best = nullptr;
			for (const auto& group : m_groups) {
				if (std::find(group.agents.begin(), group.agents.end(), agent) == group.agents.end())
					continue;
				for (const auto& rule : group.rules) {
					if (!std::regex_search(path, rule.matcher))
						continue;
					if (!best || rule.pattern.size() > best->pattern.size()
						|| (rule.pattern.size() == best->pattern.size() && rule.allow && !best->allow))
						best = &rule;
				}
			}
			return !best || best->allow;
		}

		std::optional<double> Parser::getDelay(const std::string& userAgent) const {
			std::string agent = selectAgent(userAgent);
			if (agent.empty())
				return std::nullopt;

			for (const auto& group : m_groups) {
				if (group.crawlDelay && std::find(group.agents.begin(), group.agents.end(), agent) != group.agents.end())
					return group.crawlDelay;
			}
			return std::nullopt;
		}

		//rules are prefixes; * matches anything, a trailing $ anchors the end
		std::regex Parser::generateRegex(const std::string& value) {
			std::string regexPattern = "^";
			for (size_t i = 0; i < value.size(); ++i) {
				char c = value[i];
				if (c == '*') {
					regexPattern += ".*";
				}
				else if (c == '$' && i + 1 == value.size()) {
					regexPattern += '$';
				}
				else {
					if (std::string("\\^$.|?+()[]{}").find(c) != std::string::npos)
						regexPattern += '\\';
					regexPattern += c;
				}
			}
			return std::regex(regexPattern);
		}

	}

	std::shared_ptr<const RobotsAgent> RobotsAgent::allowAll() {
		static const auto agent = std::make_shared<const RobotsAgent>(nullptr, "*");
		return agent;
	}

	bool RobotsAgent::isAllowed(const std::string& url) const {
		if (!m_parser)
			return true;
		auto link = Link::parse(url);
		if (!link)
			return true;
		return m_parser->checkUrl(link->getRelativePath(), m_userAgent);
	}

	std::optional<double> RobotsAgent::getCrawlDelay() const {
		if (!m_parser)
			return std::nullopt;
		if (auto delay = m_parser->getDelay(m_userAgent))
			return delay;
		return m_parser->getDelay("*");
	}

	const std::vector<std::string>& RobotsAgent::getSitemaps() const {
		static const std::vector<std::string> none;
		if (!m_parser)
			return none;
		return m_parser->getSitemaps();
	}

	std::shared_ptr<const RobotsAgent> RobotsPolicyProvider::getAgent(const std::string& origin, const std::string& userAgent) {
		{
			std::lock_guard<std::mutex> lock(m_mutex);
			auto it = m_cache.find(origin);
			if (it != m_cache.end())
				return std::make_shared<const RobotsAgent>(it->second, userAgent);
		}

		//concurrent first callers may both fetch; the first to store wins
		auto parser = fetchParser(origin, userAgent);

		std::lock_guard<std::mutex> lock(m_mutex);
		auto inserted = m_cache.emplace(origin, parser);
		return std::make_shared<const RobotsAgent>(inserted.first->second, userAgent);
	}

	std::shared_ptr<const robots::Parser> RobotsPolicyProvider::fetchParser(const std::string& origin, const std::string& userAgent) const {
		std::string robotsUrl = origin + "/robots.txt";
		try {
			FetchResult result = m_fetcher.fetchChain(robotsUrl, userAgent);
			if (!result.response.ok()) {
				log::info("No robots.txt for ", origin, " (status ", result.response.statusCode, "), allowing crawl by default");
				return std::make_shared<const robots::Parser>("");
			}
			log::info("Successfully fetched robots.txt for ", origin);
			return std::make_shared<const robots::Parser>(result.response.text);
		}
		catch (const FetchError& ex) {
			log::warn("Failed to fetch robots.txt for ", origin, ": ", ex.what());
			return nullptr;
		}
		catch (const std::regex_error& ex) {
			log::warn("Unusable robots.txt for ", origin, ": ", ex.what());
			return nullptr;
		}
	}

}
