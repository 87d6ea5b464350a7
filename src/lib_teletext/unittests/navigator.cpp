#include "tests/tests.hpp"
#include "fakes.hpp"
#include "lib_teletext/navigator.hpp"

using namespace Tests;
using namespace Teletext;

namespace {

// Fetches and completions only run when run() is called, so every
// intermediate state can be observed.
struct NavHarness {
	NavHarness()
		: parser(24, 40, clock), loader(transport, parser),
		  cache(createPageStore(storeConfig()), createInflightTable(), loader, background, completion),
		  nav(cache) {
	}

	PageStoreConfig storeConfig() {
		PageStoreConfig cfg;
		cfg.clock = clock;
		return cfg;
	}

	void run() {
		while(background.runPending() + completion.runPending() > 0) {
		}
	}

	PageId displayed() const {
		ASSERT(nav.view().state == NavState::Displaying);
		return nav.view().page->id;
	}

	FakeTransport transport;
	std::shared_ptr<FakeClock> clock = std::make_shared<FakeClock>();
	PageParser parser;
	PageLoader loader;
	ExecutorQueue background;
	ExecutorQueue completion;
	PageCache cache;
	Navigator nav;
};

std::vector<PageId> pages(std::initializer_list<int> numbers) {
	std::vector<PageId> r;
	for(auto n : numbers)
		r.push_back(PageId(n));
	return r;
}

unittest("Navigator: starts idle with an empty history") {
	NavHarness h;
	ASSERT(h.nav.view().state == NavState::Idle);
	ASSERT_EQUALS(-1, h.nav.historyCursor());
	ASSERT_EQUALS(0u, h.nav.history().size());
	ASSERT(h.nav.view().page == nullptr);
}

unittest("Navigator: goTo loads then displays") {
	NavHarness h;
	h.transport.serve(PageId(100), makePage("index"));

	ASSERT(h.nav.goTo(PageId(100)) == Nav::Ok);
	ASSERT(h.nav.view().state == NavState::Loading);
	ASSERT_EQUALS(PageId(100), h.nav.view().target);
	ASSERT_EQUALS(0u, h.nav.history().size());

	h.run();
	ASSERT_EQUALS(PageId(100), h.displayed());
	ASSERT_EQUALS(pages({100}), h.nav.history());
	ASSERT_EQUALS(0, h.nav.historyCursor());
}

unittest("Navigator: going to the same page twice is idempotent") {
	NavHarness h;
	h.transport.serve(PageId(100), makePage("index"));

	ASSERT(h.nav.goTo(PageId(100)) == Nav::Ok);
	ASSERT(h.nav.goTo(PageId(100)) == Nav::Unchanged);
	h.run();
	auto const page = h.nav.view().page;
	ASSERT(h.nav.goTo(PageId(100)) == Nav::Unchanged);

	ASSERT(h.nav.view().page == page);
	ASSERT_EQUALS(pages({100}), h.nav.history());
	ASSERT_EQUALS(1, h.transport.callCount(PageId(100)));
}

unittest("Navigator: history bounds") {
	NavHarness h;
	h.transport.serve(PageId(100), makePage("a"));
	h.transport.serve(PageId(200), makePage("b"));

	ASSERT(h.nav.back() == Nav::NoHistory);
	ASSERT(h.nav.forward() == Nav::NoHistory);
	ASSERT(h.nav.view().state == NavState::Idle);

	h.nav.goTo(PageId(100));
	h.run();
	h.nav.goTo(PageId(200));
	h.run();

	ASSERT(h.nav.forward() == Nav::NoHistory);
	ASSERT_EQUALS(PageId(200), h.displayed());
	ASSERT_EQUALS(1, h.nav.historyCursor());

	ASSERT(h.nav.back() == Nav::Ok);
	ASSERT(h.nav.view().state == NavState::Loading);
	h.run();
	ASSERT_EQUALS(PageId(100), h.displayed());
	ASSERT_EQUALS(0, h.nav.historyCursor());

	ASSERT(h.nav.back() == Nav::NoHistory);
	ASSERT_EQUALS(PageId(100), h.displayed());
	ASSERT_EQUALS(0, h.nav.historyCursor());

	ASSERT(h.nav.forward() == Nav::Ok);
	h.run();
	ASSERT_EQUALS(PageId(200), h.displayed());
	ASSERT_EQUALS(pages({100, 200}), h.nav.history());
}

unittest("Navigator: back, forward and refresh fetch expired pages again") {
	NavHarness h;
	h.transport.serve(PageId(100), makePage("a"));
	h.transport.serve(PageId(200), makePage("b"));
	h.nav.goTo(PageId(100));
	h.run();
	h.nav.goTo(PageId(200));
	h.run();

	// still fresh: served from the cache at once
	ASSERT(h.nav.back() == Nav::Ok);
	ASSERT_EQUALS(PageId(100), h.displayed());
	ASSERT_EQUALS(1, h.transport.callCount(PageId(100)));

	h.clock->advance(Fraction(301, 1));
	ASSERT(h.nav.forward() == Nav::Ok);
	ASSERT(h.nav.view().state == NavState::Loading);
	h.run();
	ASSERT_EQUALS(PageId(200), h.displayed());
	ASSERT_EQUALS(2, h.transport.callCount(PageId(200)));

	ASSERT(h.nav.refresh() == Nav::Ok);
	ASSERT_EQUALS(2, h.transport.callCount(PageId(200)));

	h.clock->advance(Fraction(301, 1));
	ASSERT(h.nav.refresh() == Nav::Ok);
	h.run();
	ASSERT_EQUALS(3, h.transport.callCount(PageId(200)));

	ASSERT(h.nav.back() == Nav::Ok);
	h.run();
	ASSERT_EQUALS(PageId(100), h.displayed());
	ASSERT_EQUALS(2, h.transport.callCount(PageId(100)));
	ASSERT_EQUALS(pages({100, 200}), h.nav.history());
}

unittest("Navigator: a new visit drops the forward entries") {
	NavHarness h;
	for(auto n : { 100, 200, 300, 400 })
		h.transport.serve(PageId(n), makePage("page"));

	for(auto n : { 100, 200, 300 }) {
		h.nav.goTo(PageId(n));
		h.run();
	}
	h.nav.back();
	h.run();
	h.nav.back();
	h.run();
	ASSERT_EQUALS(PageId(100), h.displayed());

	h.nav.goTo(PageId(400));
	h.run();
	ASSERT_EQUALS(pages({100, 400}), h.nav.history());
	ASSERT_EQUALS(1, h.nav.historyCursor());
	ASSERT(h.nav.forward() == Nav::NoHistory);
}

unittest("Navigator: a failed navigation leaves the history untouched") {
	NavHarness h;
	h.transport.serve(PageId(100), makePage("index"));
	h.transport.fail(PageId(150), ErrorKind::ServerError, 503);

	h.nav.goTo(PageId(100));
	h.run();
	h.nav.goTo(PageId(150));
	h.run();

	ASSERT(h.nav.view().state == NavState::Failed);
	ASSERT(h.nav.view().error.kind == ErrorKind::ServerError);
	ASSERT_EQUALS(503, h.nav.view().error.status);
	ASSERT_EQUALS(PageId(150), h.nav.view().target);
	ASSERT_EQUALS(PageId(100), h.nav.view().page->id);
	ASSERT_EQUALS(pages({100}), h.nav.history());
	ASSERT_EQUALS(0, h.nav.historyCursor());
}

unittest("Navigator: reload after a server error fetches again") {
	NavHarness h;
	h.transport.fail(PageId(150), ErrorKind::ServerError, 503, 1);
	h.transport.serve(PageId(150), makePage("recovered"));

	h.nav.goTo(PageId(150));
	h.run();
	ASSERT(h.nav.view().state == NavState::Failed);
	ASSERT_EQUALS(1, h.transport.callCount(PageId(150)));

	ASSERT(h.nav.reload() == Nav::Ok);
	ASSERT(h.nav.view().state == NavState::Loading);
	h.run();
	ASSERT_EQUALS(2, h.transport.callCount(PageId(150)));
	ASSERT_EQUALS(PageId(150), h.displayed());
	ASSERT_EQUALS(pages({150}), h.nav.history());
}

unittest("Navigator: reload bypasses the cache") {
	NavHarness h;
	h.transport.serve(PageId(100), makePage("v1"));
	ASSERT(h.nav.reload() == Nav::NoHistory);

	h.nav.goTo(PageId(100));
	h.run();
	h.transport.serve(PageId(100), makePage("v2"));

	ASSERT(h.nav.reload() == Nav::Ok);
	h.run();
	ASSERT_EQUALS(2, h.transport.callCount(PageId(100)));
	ASSERT_EQUALS("v2", h.nav.view().page->rowText(0).substr(0, 2));
	ASSERT_EQUALS(pages({100}), h.nav.history());

	// refresh goes through the cache
	ASSERT(h.nav.refresh() == Nav::Ok);
	h.run();
	ASSERT_EQUALS(2, h.transport.callCount(PageId(100)));
	ASSERT_EQUALS(PageId(100), h.displayed());
}

unittest("Navigator: a broken reload keeps showing the previous version") {
	NavHarness h;
	h.transport.serve(PageId(100), makePage("good"));
	h.nav.goTo(PageId(100));
	h.run();
	auto const good = h.nav.view().page;

	h.transport.serve(PageId(100), "<pre>&broken</pre>");
	h.nav.reload();
	h.run();
	ASSERT(h.nav.view().state == NavState::Displaying);
	ASSERT(h.nav.view().stale);
	ASSERT(h.nav.view().page == good);
}

unittest("Navigator: subpages wrap around without history entries") {
	NavHarness h;
	for(int sub = 1; sub <= 3; ++sub)
		h.transport.serve(PageId(100, sub), makePage("sub " + std::to_string(sub), 3));

	h.nav.goTo(PageId(100));
	h.run();

	for(int i = 0; i < 3; ++i) {
		ASSERT(h.nav.nextSubpage() == Nav::Ok);
		h.run();
	}
	ASSERT_EQUALS(PageId(100, 1), h.displayed());
	ASSERT_EQUALS(pages({100}), h.nav.history());
	ASSERT_EQUALS(1, h.transport.callCount(PageId(100, 1)));

	ASSERT(h.nav.prevSubpage() == Nav::Ok);
	h.run();
	ASSERT_EQUALS(PageId(100, 3), h.displayed());
	ASSERT_EQUALS(pages({100}), h.nav.history());
}

unittest("Navigator: single subpage pages don't cycle") {
	NavHarness h;
	ASSERT(h.nav.nextSubpage() == Nav::NoHistory);
	h.transport.serve(PageId(100), makePage("alone"));
	h.nav.goTo(PageId(100));
	h.run();
	ASSERT(h.nav.nextSubpage() == Nav::Unchanged);
	ASSERT(h.nav.prevSubpage() == Nav::Unchanged);
}

unittest("Navigator: back after a link returns to the first subpage") {
	NavHarness h;
	auto const body = "Uutiset\n\n\n\n\n<a href=\"?P=200\">Urheilu</a>";
	h.transport.serve(PageId(100, 1), makePage(body, 2));
	h.transport.serve(PageId(100, 2), makePage(body, 2));
	h.transport.serve(PageId(200), makePage("sport"));

	h.nav.goTo(PageId(100));
	h.run();
	h.nav.nextSubpage();
	h.run();
	ASSERT_EQUALS(PageId(100, 2), h.displayed());

	auto const link = h.nav.view().page->linkAt(5, 0);
	ASSERT(link != nullptr);
	ASSERT_EQUALS(PageId(200), link->target);
	ASSERT(h.nav.follow(*link) == Nav::Ok);
	h.run();
	ASSERT_EQUALS(PageId(200), h.displayed());

	ASSERT(h.nav.back() == Nav::Ok);
	h.run();
	ASSERT_EQUALS(PageId(100, 1), h.displayed());
	ASSERT_EQUALS(pages({100, 200}), h.nav.history());
}

unittest("Navigator: superseded results are not displayed") {
	NavHarness h;
	h.transport.serve(PageId(100), makePage("first"));
	h.transport.serve(PageId(200), makePage("second"));

	h.nav.goTo(PageId(100));
	h.nav.goTo(PageId(200));
	ASSERT_EQUALS(PageId(200), h.nav.view().target);
	h.run();

	ASSERT_EQUALS(PageId(200), h.displayed());
	ASSERT_EQUALS(pages({200}), h.nav.history());
	// the superseded fetch still completed and was cached
	ASSERT(h.cache.get(PageId(100)) != nullptr);
}

unittest("Navigator: adjacent pages wrap around") {
	NavHarness h;
	h.transport.serve(PageId(999), makePage("last"));
	h.transport.serve(PageId(100), makePage("first"));

	ASSERT(h.nav.nextPage() == Nav::NoHistory);
	h.nav.goTo(PageId(999));
	h.run();
	ASSERT(h.nav.nextPage() == Nav::Ok);
	h.run();
	ASSERT_EQUALS(PageId(100), h.displayed());
	ASSERT(h.nav.prevPage() == Nav::Ok);
	h.run();
	ASSERT_EQUALS(PageId(999), h.displayed());
	ASSERT_EQUALS(pages({999, 100, 999}), h.nav.history());
}

unittest("Navigator: the listener sees every transition") {
	NavHarness h;
	h.transport.serve(PageId(100), makePage("index"));
	std::vector<NavState> states;
	h.nav.setListener([&](ViewState const& view) {
		states.push_back(view.state);
	});

	h.nav.goTo(PageId(100));
	h.run();
	h.nav.goTo(PageId(404));
	h.run();

	ASSERT_EQUALS(4u, states.size());
	ASSERT(states[0] == NavState::Loading);
	ASSERT(states[1] == NavState::Displaying);
	ASSERT(states[2] == NavState::Loading);
	ASSERT(states[3] == NavState::Failed);
	ASSERT(h.nav.view().error.kind == ErrorKind::NotFound);
}

unittest("Navigator: completions after destruction are dropped") {
	FakeTransport transport;
	transport.serve(PageId(100), makePage("index"));
	auto clock = std::make_shared<FakeClock>();
	PageParser parser(24, 40, clock);
	PageLoader loader(transport, parser);
	ExecutorSync background;
	ExecutorQueue completion;
	PageStoreConfig storeCfg;
	storeCfg.clock = clock;
	PageCache cache(createPageStore(storeCfg), createInflightTable(), loader, background, completion);

	{
		Navigator nav(cache);
		nav.goTo(PageId(100));
	}
	ASSERT_EQUALS(1, completion.runPending());
	ASSERT(cache.get(PageId(100)) != nullptr);
}

}
