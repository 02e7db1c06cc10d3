#pragma once

#include "seocrawler/HttpTransport.h"

namespace seocrawler {

	//libcurl through cpr, redirects disabled so the fetcher sees every hop
	class CprTransport : public HttpTransport {
	public:
		HttpResponse get(const HttpRequest& request) override;

		//"Name: value" lines of a raw header block; status lines are skipped
		static HeaderList parseRawHeaders(const std::string& rawHeader);
	};

}
