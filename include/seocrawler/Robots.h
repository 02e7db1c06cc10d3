#pragma once

#include "seocrawler/Fetcher.h"

#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

namespace seocrawler {

	namespace robots {

		struct Rule {
			std::string pattern;
			std::regex matcher;
			bool allow = false;
		};

		struct Group {
			std::vector<std::string> agents;
			std::vector<Rule> rules;
			std::optional<double> crawlDelay;
		};

		class Parser {
		public:
			explicit Parser(const std::string& robotsTxtContent);

			//longest matching rule wins, allow wins a tie, no match means allowed
			bool checkUrl(const std::string& path, const std::string& userAgent = "*") const;

			std::optional<double> getDelay(const std::string& userAgent = "*") const;

			const std::vector<std::string>& getSitemaps() const { return m_sitemaps; }
			const std::vector<Group>& getGroups() const { return m_groups; }

		private:
			void tokenizeInput(const std::string& robotsTxtContent);

			//agent key of the groups that apply to a user agent, empty when none does
			std::string selectAgent(const std::string& userAgent) const;

			static std::regex generateRegex(const std::string& value);

			std::vector<Group> m_groups;
			std::vector<std::string> m_sitemaps;
		};

	}

	//robots view for one origin and one user agent
	class RobotsAgent {
	public:
		RobotsAgent(std::shared_ptr<const robots::Parser> parser, std::string userAgent)
			: m_parser(std::move(parser)), m_userAgent(std::move(userAgent)) {}

		//permissive stand-in when robots are ignored or unreachable
		static std::shared_ptr<const RobotsAgent> allowAll();

		bool isAllowed(const std::string& url) const;

		//agent group first, then *
		std::optional<double> getCrawlDelay() const;

		const std::vector<std::string>& getSitemaps() const;

	private:
		std::shared_ptr<const robots::Parser> m_parser;
		std::string m_userAgent;
	};

	//fetches robots.txt once per origin and fails open
	class RobotsPolicyProvider {
	public:
		explicit RobotsPolicyProvider(const Fetcher& fetcher) : m_fetcher(fetcher) {}

		std::shared_ptr<const RobotsAgent> getAgent(const std::string& origin, const std::string& userAgent);

	private:
		std::shared_ptr<const robots::Parser> fetchParser(const std::string& origin, const std::string& userAgent) const;

		const Fetcher& m_fetcher;
		std::mutex m_mutex;
		//nullptr caches "unreachable, allow everything"
		std::unordered_map<std::string, std::shared_ptr<const robots::Parser>> m_cache;
	};

}
