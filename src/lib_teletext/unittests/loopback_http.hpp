#pragma once

#include <atomic>
#include <functional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace Teletext {

inline std::string httpResponse(int status, std::string const& body) {
	return "HTTP/1.0 " + std::to_string(status) + " Status\r\n"
	    "Content-Length: " + std::to_string(body.size()) + "\r\n"
	    "Connection: close\r\n\r\n" + body;
}

// HTTP server on 127.0.0.1, one request per connection.
// 'respond' gets the request line ("GET /100_0001 HTTP/1.1") and returns the
// whole response, or an empty string to leave the request unanswered.
struct LoopbackHttpServer {
	public:
		typedef std::function<std::string(std::string const& requestLine)> Responder;

		explicit LoopbackHttpServer(Responder respond) : respond(respond) {
			listener = socket(AF_INET, SOCK_STREAM, 0);
			if(listener < 0)
				throw std::runtime_error("socket failed");

			sockaddr_in addr {};
			addr.sin_family = AF_INET;
			addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
			addr.sin_port = htons(0); // any free port
			if(bind(listener, (sockaddr*)&addr, sizeof(addr)) < 0)
				fail("bind failed");

			socklen_t addrLen = sizeof(addr);
			if(getsockname(listener, (sockaddr*)&addr, &addrLen) < 0)
				fail("getsockname failed");
			port = ntohs(addr.sin_port);

			if(listen(listener, 8) < 0)
				fail("listen failed");

			worker = std::thread(&LoopbackHttpServer::serve, this);
		}

		~LoopbackHttpServer() {
			stop = true;
			worker.join();
			for(auto client : unanswered)
				close(client);
			close(listener);
		}

		// URL template for the transport
		std::string url() const {
			return "http://127.0.0.1:" + std::to_string(port) + "/{page}_{subpage}";
		}

		int requestCount() const {
			return requests;
		}

	private:
		void fail(const char* what) {
			close(listener);
			throw std::runtime_error(what);
		}

		void serve() {
			while(!stop) {
				pollfd pfd {};
				pfd.fd = listener;
				pfd.events = POLLIN;
				if(poll(&pfd, 1, 20) <= 0)
					continue;

				auto const client = accept(listener, nullptr, nullptr);
				if(client < 0)
					continue;

				auto const request = readRequest(client);
				++requests;
				auto const response = respond(request.substr(0, request.find("\r\n")));
				if(response.empty()) {
					unanswered.push_back(client);
					continue;
				}
				sendAll(client, response);
				close(client);
			}
		}

		// reads up to the end of the headers
		static std::string readRequest(int client) {
			std::string r;
			char buffer[1024];
			while(r.find("\r\n\r\n") == std::string::npos) {
				auto const n = recv(client, buffer, sizeof buffer, 0);
				if(n <= 0)
					break;
				r.append(buffer, n);
			}
			return r;
		}

		static void sendAll(int client, std::string const& data) {
			size_t sent = 0;
			while(sent < data.size()) {
				auto const n = send(client, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
				if(n <= 0)
					return;
				sent += n;
			}
		}

		Responder const respond;
		int listener = -1;
		int port = 0;
		std::atomic<bool> stop { false };
		std::atomic<int> requests { 0 };
		std::vector<int> unanswered; // worker thread only, until joined
		std::thread worker;
};

}
