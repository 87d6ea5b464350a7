#include "tests/tests.hpp"
#include "fakes.hpp"
#include "loopback_http.hpp"
#include "lib_teletext/transport.hpp"
#include <cstdio>
#include <fstream>

using namespace Tests;
using namespace Teletext;

namespace {

ErrorKind fetchError(ITransport& transport, PageId id) {
	try {
		transport.fetch(id);
	} catch(Error const& e) {
		return e.kind();
	}
	throw std::runtime_error("no error was raised");
}

unittest("Transport: URL template expansion") {
	ASSERT_EQUALS("https://host/json?P=100_0001", expandUrl("https://host/json?P={page}_{subpage}", PageId(100)));
	ASSERT_EQUALS("http://h/871/12", expandUrl("http://h/{page}/{subpage}", PageId(871, 12)));
	ASSERT_EQUALS("static", expandUrl("static", PageId(871, 12)));
	ASSERT_THROWN(expandUrl("http://h/{nope}", PageId(100)));
	ASSERT_THROWN(expandUrl("http://h/{page", PageId(100)));
}

unittest("Transport: transient failures are retried") {
	FakeTransport fake;
	fake.serve(PageId(100), "ok");
	fake.fail(PageId(100), ErrorKind::Timeout, 0, 2);

	TransportConfig cfg;
	cfg.retryCount = 2;
	cfg.source = &fake;
	auto transport = createTransport(cfg);

	ASSERT_EQUALS("ok", transport->fetch(PageId(100)));
	ASSERT_EQUALS(3, fake.callCount(PageId(100)));
}

unittest("Transport: retries are bounded") {
	FakeTransport fake;
	fake.fail(PageId(100), ErrorKind::Network);

	TransportConfig cfg;
	cfg.retryCount = 2;
	cfg.source = &fake;
	auto transport = createTransport(cfg);

	ASSERT(fetchError(*transport, PageId(100)) == ErrorKind::Network);
	ASSERT_EQUALS(3, fake.callCount(PageId(100)));
}

unittest("Transport: definitive failures are not retried") {
	FakeTransport fake;
	fake.fail(PageId(150), ErrorKind::ServerError, 503);
	fake.fail(PageId(160), ErrorKind::MalformedEncoding);

	TransportConfig cfg;
	cfg.source = &fake;
	auto transport = createTransport(cfg);

	try {
		transport->fetch(PageId(150));
		ASSERT(0);
	} catch(Error const& e) {
		ASSERT(e.kind() == ErrorKind::ServerError);
		ASSERT_EQUALS(503, e.status());
	}
	ASSERT_EQUALS(1, fake.callCount(PageId(150)));

	ASSERT(fetchError(*transport, PageId(199)) == ErrorKind::NotFound);
	ASSERT_EQUALS(1, fake.callCount(PageId(199)));

	ASSERT(fetchError(*transport, PageId(160)) == ErrorKind::MalformedEncoding);
	ASSERT_EQUALS(1, fake.callCount(PageId(160)));
}

unittest("Transport: invalid configuration") {
	TransportConfig cfg;
	cfg.retryCount = -1;
	ASSERT_THROWN(createTransport(cfg));

	TransportConfig broken;
	broken.urlTemplate = "http://h/{unknown}";
	ASSERT_THROWN(createHttpTransport(broken));
}

secondclasstest("Transport: local files through the HTTP transport") {
	auto const path = std::string("/tmp/ttv_transport_test_201.html");
	{
		std::ofstream file(path);
		file << "<pre>page 201</pre>";
	}

	TransportConfig cfg;
	cfg.urlTemplate = "file:///tmp/ttv_transport_test_{page}.html";
	cfg.retryCount = 0;
	auto transport = createTransport(cfg);

	ASSERT_EQUALS("<pre>page 201</pre>", transport->fetch(PageId(201)));
	ASSERT(fetchError(*transport, PageId(202)) == ErrorKind::NotFound);

	std::remove(path.c_str());
}

secondclasstest("Transport: HTTP status codes") {
	LoopbackHttpServer server([](std::string const& requestLine) {
		if(requestLine.find(" /100_0001 ") != std::string::npos)
			return httpResponse(200, "<pre>sivu 100</pre>");
		if(requestLine.find(" /503_0001 ") != std::string::npos)
			return httpResponse(503, "busy");
		return httpResponse(404, "");
	});

	TransportConfig cfg;
	cfg.urlTemplate = server.url();
	cfg.retryCount = 0;
	auto transport = createHttpTransport(cfg);

	ASSERT_EQUALS("<pre>sivu 100</pre>", transport->fetch(PageId(100)));
	ASSERT(fetchError(*transport, PageId(404)) == ErrorKind::NotFound);

	try {
		transport->fetch(PageId(503));
		ASSERT(0);
	} catch(Error const& e) {
		ASSERT(e.kind() == ErrorKind::ServerError);
		ASSERT_EQUALS(503, e.status());
	}
}

secondclasstest("Transport: unanswered requests time out and are retried") {
	LoopbackHttpServer server([](std::string const&) {
		return std::string();
	});

	TransportConfig cfg;
	cfg.urlTemplate = server.url();
	cfg.requestTimeoutMs = 300;
	cfg.retryCount = 1;
	auto transport = createTransport(cfg);

	ASSERT(fetchError(*transport, PageId(100)) == ErrorKind::Timeout);
	ASSERT_EQUALS(2, server.requestCount());
}

}
