#pragma once

#include "seocrawler/Errors.h"
#include "seocrawler/HttpTransport.h"

#include <chrono>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace seocrawler {

	//scripted responses per url; unknown urls answer 404
	class FakeTransport : public HttpTransport {
	public:
		void on(const std::string& url, HttpResponse response) {
			std::lock_guard<std::mutex> lock(m_mutex);
			response.url = url;
			m_responses[{ url, "" }] = std::move(response);
		}

		//takes precedence over on() for that user agent
		void onAgent(const std::string& url, const std::string& userAgent, HttpResponse response) {
			std::lock_guard<std::mutex> lock(m_mutex);
			response.url = url;
			m_responses[{ url, userAgent }] = std::move(response);
		}

		//every request for url throws TransportError, optionally only for one user agent
		void fail(const std::string& url, const std::string& userAgent = "") {
			std::lock_guard<std::mutex> lock(m_mutex);
			m_failures.insert({ url, userAgent });
		}

		//requests for url wait this long before answering or failing
		void delay(const std::string& url, std::chrono::milliseconds wait) {
			std::lock_guard<std::mutex> lock(m_mutex);
			m_delays[url] = wait;
		}

		HttpResponse get(const HttpRequest& request) override {
			std::chrono::milliseconds wait{ 0 };
			{
				std::lock_guard<std::mutex> lock(m_mutex);
				auto it = m_delays.find(request.url);
				if (it != m_delays.end())
					wait = it->second;
			}
			if (wait.count() > 0)
				std::this_thread::sleep_for(wait);

			std::lock_guard<std::mutex> lock(m_mutex);
			std::string userAgent;
			for (const auto& [name, value] : request.headers) {
				if (name == "User-Agent")
					userAgent = value;
			}
			m_requests.emplace_back(request.url, userAgent);

			if (m_failures.count({ request.url, userAgent }) != 0 || m_failures.count({ request.url, "" }) != 0)
				throw TransportError("connection refused: " + request.url);

			auto it = m_responses.find({ request.url, userAgent });
			if (it == m_responses.end())
				it = m_responses.find({ request.url, "" });
			if (it != m_responses.end())
				return it->second;

			HttpResponse notFound;
			notFound.statusCode = 404;
			notFound.url = request.url;
			notFound.headers = { { "Content-Type", "text/plain" } };
			return notFound;
		}

		size_t count(const std::string& url) const {
			std::lock_guard<std::mutex> lock(m_mutex);
			size_t n = 0;
			for (const auto& request : m_requests) {
				if (request.first == url)
					++n;
			}
			return n;
		}

		//(url, user agent) in arrival order
		std::vector<std::pair<std::string, std::string>> requests() const {
			std::lock_guard<std::mutex> lock(m_mutex);
			return m_requests;
		}

	private:
		mutable std::mutex m_mutex;
		std::map<std::pair<std::string, std::string>, HttpResponse> m_responses;
		std::set<std::pair<std::string, std::string>> m_failures;
		std::map<std::string, std::chrono::milliseconds> m_delays;
		std::vector<std::pair<std::string, std::string>> m_requests;
	};

	inline HttpResponse htmlPage(const std::string& body, int status = 200) {
		HttpResponse response;
		response.statusCode = status;
		response.headers = { { "Content-Type", "text/html; charset=utf-8" } };
		response.text = body;
		return response;
	}

	inline HttpResponse xmlDocument(const std::string& body) {
		HttpResponse response;
		response.statusCode = 200;
		response.headers = { { "Content-Type", "application/xml" } };
		response.text = body;
		return response;
	}

	inline HttpResponse textDocument(const std::string& body, int status = 200) {
		HttpResponse response;
		response.statusCode = status;
		response.headers = { { "Content-Type", "text/plain" } };
		response.text = body;
		return response;
	}

	inline HttpResponse redirectTo(const std::string& location, int status = 301) {
		HttpResponse response;
		response.statusCode = status;
		response.headers = { { "Location", location } };
		return response;
	}

	inline HttpResponse statusOnly(int status) {
		HttpResponse response;
		response.statusCode = status;
		return response;
	}

}
