#include "seocrawler/Config.h"
#include "seocrawler/CprTransport.h"
#include "seocrawler/Crawler.h"
#include "seocrawler/IndexabilityAuditor.h"
#include "seocrawler/Log.h"
#include "seocrawler/RequestHandler.h"
#include "seocrawler/ThreadPool.h"
#include "seocrawler/UrlCanonicalizer.h"

#include <ixwebsocket/IXNetSystem.h>
#include <ixwebsocket/IXWebSocketServer.h>

#include <algorithm>
#include <exception>
#include <memory>
#include <thread>

using namespace seocrawler;

int main() {
	Config config = Config::fromEnvironment();
	log::setLevel(config.logLevel);

	CprTransport transport;
	Crawler crawler(transport, config, UrlCanonicalizer(IgnoreList::fromFile(config.ignoreExtensionsFile)));
	IndexabilityAuditor auditor(transport, config);
	RequestHandler handler(crawler, auditor, config.snapshotDir);

	//crawls and audits run here, never on the socket thread
	ThreadPool requests(std::max(2u, std::thread::hardware_concurrency()));

	ix::initNetSystem();
	ix::WebSocketServer server(config.port, config.host);

	server.setOnClientMessageCallback([&](std::shared_ptr<ix::ConnectionState> connectionState, ix::WebSocket& webSocket,
		const ix::WebSocketMessagePtr& msg) {
		if (msg->type == ix::WebSocketMessageType::Open) {
			log::info("New connection ", connectionState->getId(), " from ", connectionState->getRemoteIp(),
				" uri ", msg->openInfo.uri);
		}
		else if (msg->type == ix::WebSocketMessageType::Message) {
			log::debug("Received: ", msg->str);

			//the reply goes out only if the client is still connected
			std::weak_ptr<ix::WebSocket> client;
			for (const auto& candidate : server.getClients()) {
				if (candidate.get() == &webSocket)
					client = candidate;
			}

			std::string message = msg->str;
			requests.enqueue([&handler, client, message] {
				std::string reply;
				try {
					reply = handler.handle(message);
				}
				catch (const std::exception& ex) {
					log::error("Unhandled failure answering a message: ", ex.what());
					reply = json{ { "ok", false }, { "error", "internal_error" } }.dump();
				}
				if (auto socket = client.lock())
					socket->sendText(reply);
				else
					log::warn("Client went away before its reply was ready");
			});
		}
		else if (msg->type == ix::WebSocketMessageType::Close) {
			log::info("Closed connection ", connectionState->getId());
		}
		else if (msg->type == ix::WebSocketMessageType::Error) {
			log::error("Connection error: ", msg->errorInfo.reason);
		}
	});

	auto res = server.listen();
	if (!res.first) {
		log::error("Error occurred while listening: ", res.second);
		ix::uninitNetSystem();
		return 1;
	}

	log::info("Listening on ", config.host, ":", config.port);
	server.start();
	server.wait();

	ix::uninitNetSystem();
	return 0;
}
