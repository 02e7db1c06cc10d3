#include "seocrawler/Types.h"

namespace seocrawler {

	const char* toString(DiscoveredBy discoveredBy) {
		switch (discoveredBy) {
		case DiscoveredBy::Html: return "html";
		case DiscoveredBy::Sitemap: return "sitemap";
		case DiscoveredBy::Both: return "both";
		}
		return "html";
	}

	void StatusBuckets::add(int status) {
		if (status == 0)
			++unfetched;
		else if (status >= 200 && status < 300)
			++success;
		else if (status >= 300 && status < 400)
			++redirect;
		else if (status >= 400 && status < 500)
			++clientError;
		else if (status >= 500 && status < 600)
			++serverError;
	}

}
