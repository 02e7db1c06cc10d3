#pragma once

#include <string>
#include <utility>
#include <vector>

namespace seocrawler {

	//raw attribute values in document order, nothing resolved yet
	struct HtmlSignals {
		//href of every <a> that has one, entities already decoded
		std::vector<std::string> anchors;
		std::vector<std::string> canonicalHrefs;
		//(hreflang, href) of <link rel="alternate" hreflang=...>
		std::vector<std::pair<std::string, std::string>> alternates;
		//content of every <meta name="robots">
		std::vector<std::string> metaRobots;
	};

	//trimmed anchors; fragment-only, script, mailto and tel links are dropped
	std::vector<std::string> extractHrefs(const std::string& html);

	HtmlSignals extractHtmlSignals(const std::string& html);

}
