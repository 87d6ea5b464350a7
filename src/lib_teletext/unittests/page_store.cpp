#include "tests/tests.hpp"
#include "fakes.hpp"
#include "lib_teletext/page_store.hpp"
#include "lib_teletext/inflight.hpp"

using namespace Tests;
using namespace Teletext;

namespace {

PagePtr makeTestPage(PageId id, char32_t firstChar = U'x') {
	Grid grid(2, 4);
	grid.at(0, 0).character = firstChar;
	return std::make_shared<const Page>(id, grid, 1, std::vector<Link>(), Fraction(0, 1));
}

std::unique_ptr<IPageStore> makeStore(std::shared_ptr<FakeClock> clock, int maxEntries = 64, int ttlSeconds = 300) {
	PageStoreConfig cfg;
	cfg.clock = clock;
	cfg.maxEntries = maxEntries;
	cfg.ttl = Fraction(ttlSeconds, 1);
	return createPageStore(cfg);
}

unittest("PageStore: put then get returns the stored page") {
	auto clock = std::make_shared<FakeClock>();
	auto store = makeStore(clock);
	auto page = makeTestPage(PageId(100));

	ASSERT(store->get(PageId(100)) == nullptr);
	store->put(PageId(100), page);
	ASSERT(store->get(PageId(100)) == page);
	ASSERT(*store->get(PageId(100)) == *page);
	ASSERT(store->get(PageId(100, 2)) == nullptr);
	ASSERT_EQUALS(1u, store->size());
}

unittest("PageStore: expired entries miss but stay available as last known good") {
	auto clock = std::make_shared<FakeClock>();
	auto store = makeStore(clock, 64, 300);
	auto page = makeTestPage(PageId(100));
	store->put(PageId(100), page);

	clock->advance(Fraction(299, 1));
	ASSERT(store->get(PageId(100)) == page);

	clock->advance(Fraction(1, 1));
	ASSERT(store->get(PageId(100)) == nullptr);
	ASSERT(store->lastKnownGood(PageId(100)) == page);
	ASSERT_EQUALS(1u, store->size());
}

unittest("PageStore: put replaces the entry and restarts its lifetime") {
	auto clock = std::make_shared<FakeClock>();
	auto store = makeStore(clock, 64, 10);
	auto v1 = makeTestPage(PageId(100), U'1');
	auto v2 = makeTestPage(PageId(100), U'2');

	store->put(PageId(100), v1);
	clock->advance(Fraction(8, 1));
	store->put(PageId(100), v2);
	clock->advance(Fraction(8, 1));
	ASSERT(store->get(PageId(100)) == v2);
	ASSERT_EQUALS(1u, store->size());
}

unittest("PageStore: invalidate") {
	auto clock = std::make_shared<FakeClock>();
	auto store = makeStore(clock);
	auto page = makeTestPage(PageId(100));
	store->put(PageId(100), page);

	store->invalidate(PageId(100));
	store->invalidate(PageId(555)); // unknown pages are ignored
	ASSERT(store->get(PageId(100)) == nullptr);
	ASSERT(store->lastKnownGood(PageId(100)) == page);

	store->put(PageId(100), page);
	ASSERT(store->get(PageId(100)) == page);
}

unittest("PageStore: least recently used entries are evicted") {
	auto clock = std::make_shared<FakeClock>();
	auto store = makeStore(clock, 2);
	store->put(PageId(100), makeTestPage(PageId(100)));
	store->put(PageId(200), makeTestPage(PageId(200)));

	// 100 becomes the most recently used one
	ASSERT(store->get(PageId(100)) != nullptr);

	store->put(PageId(300), makeTestPage(PageId(300)));
	ASSERT_EQUALS(2u, store->size());
	ASSERT(store->get(PageId(100)) != nullptr);
	ASSERT(store->get(PageId(200)) == nullptr);
	ASSERT(store->lastKnownGood(PageId(200)) == nullptr);
	ASSERT(store->get(PageId(300)) != nullptr);
}

unittest("PageStore: invalid configuration") {
	auto clock = std::make_shared<FakeClock>();
	ASSERT_THROWN(makeStore(clock, 0));
	auto store = makeStore(clock);
	ASSERT_THROWN(store->put(PageId(100), nullptr));
}

unittest("InflightTable: first caller fetches, the others wait") {
	auto table = createInflightTable();
	int notified = 0;
	auto waiter = [&](FetchResult const&) {
		notified++;
	};

	ASSERT(table->attach(PageId(100), waiter));
	ASSERT(!table->attach(PageId(100), waiter));
	ASSERT(table->attach(PageId(200), waiter));
	ASSERT(table->isInflight(PageId(100)));

	auto waiters = table->complete(PageId(100));
	ASSERT_EQUALS(2u, waiters.size());
	for(auto& w : waiters)
		w(FetchResult());
	ASSERT_EQUALS(2, notified);
	ASSERT(!table->isInflight(PageId(100)));
	ASSERT(table->isInflight(PageId(200)));
	ASSERT_EQUALS(0u, table->complete(PageId(100)).size());
}

}
