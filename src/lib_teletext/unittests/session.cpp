#include "tests/tests.hpp"
#include "fakes.hpp"
#include "lib_teletext/session.hpp"
#include <chrono>

using namespace Tests;
using namespace Teletext;

namespace {

void waitWhileLoading(Navigator& nav, ExecutorQueue& completion) {
	auto const deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
	while(nav.view().state == NavState::Loading) {
		ASSERT(std::chrono::steady_clock::now() < deadline);
		completion.runFor(std::chrono::milliseconds(10));
	}
}

secondclasstest("Session: end to end over a background fetch thread") {
	FakeTransport transport;
	transport.serve(PageId(100), makePage("Sisallys 200"));
	transport.serve(PageId(200), makePage("Urheilu"));

	Config cfg;
	cfg.rows = 10;
	cfg.cols = 20;
	ExecutorQueue completion;
	Session session(cfg, completion, &transport);
	auto& nav = session.navigator();

	nav.goTo(PageId(cfg.startPage));
	waitWhileLoading(nav, completion);
	ASSERT(nav.view().state == NavState::Displaying);
	ASSERT_EQUALS(10, nav.view().page->grid.rows());
	ASSERT_EQUALS(20, nav.view().page->grid.cols());

	auto const link = nav.view().page->linkAt(0, 9);
	ASSERT(link != nullptr);
	nav.follow(*link);
	waitWhileLoading(nav, completion);
	ASSERT_EQUALS(PageId(200), nav.view().page->id);
	ASSERT_EQUALS(2u, session.cache().size());
}

secondclasstest("Session: transient failures are retried by the transport") {
	FakeTransport transport;
	transport.serve(PageId(100), makePage("eventually"));
	transport.fail(PageId(100), ErrorKind::Network, 0, 2);

	Config cfg;
	cfg.retryCount = 2;
	ExecutorQueue completion;
	Session session(cfg, completion, &transport);
	session.navigator().goTo(PageId(100));
	waitWhileLoading(session.navigator(), completion);
	ASSERT(session.navigator().view().state == NavState::Displaying);
	ASSERT_EQUALS(3, transport.callCount(PageId(100)));
}

secondclasstest("Session: sessions are independent") {
	FakeTransport transport;
	transport.serve(PageId(100), makePage("shared source"));

	Config cfg;
	ExecutorQueue completion;
	Session a(cfg, completion, &transport);
	Session b(cfg, completion, &transport);

	a.navigator().goTo(PageId(100));
	waitWhileLoading(a.navigator(), completion);
	ASSERT(a.navigator().view().state == NavState::Displaying);
	ASSERT(b.navigator().view().state == NavState::Idle);
	ASSERT_EQUALS(0u, b.cache().size());
}

unittest("Session: invalid configuration is refused") {
	Config cfg;
	cfg.maxCachedPages = 0;
	ExecutorQueue completion;
	ASSERT_THROWN(std::make_unique<Session>(cfg, completion));
}

}
