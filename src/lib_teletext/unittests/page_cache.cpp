#include "tests/tests.hpp"
#include "fakes.hpp"
#include "lib_teletext/page_cache.hpp"
#include <chrono>

using namespace Tests;
using namespace Teletext;

namespace {

struct CacheHarness {
	CacheHarness(IExecutor& background)
		: parser(24, 40, clock), loader(transport, parser),
		  cache(createPageStore(storeConfig()), createInflightTable(), loader, background, completion) {
	}

	PageStoreConfig storeConfig() {
		PageStoreConfig cfg;
		cfg.clock = clock;
		return cfg;
	}

	// runs the completions until 'count' results were delivered
	void waitForResults(int count) {
		auto const deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
		while((int)results.size() < count) {
			ASSERT(std::chrono::steady_clock::now() < deadline);
			completion.runFor(std::chrono::milliseconds(10));
		}
	}

	FetchCallback collect() {
		return [this](FetchResult const& result) {
			results.push_back(result);
		};
	}

	FakeTransport transport;
	std::shared_ptr<FakeClock> clock = std::make_shared<FakeClock>();
	PageParser parser;
	PageLoader loader;
	ExecutorQueue completion;
	PageCache cache;
	std::vector<FetchResult> results;
};

unittest("PageCache: a miss fetches, stores and delivers through the completion executor") {
	ExecutorSync background;
	CacheHarness h(background);
	h.transport.serve(PageId(100), makePage("hello"));

	h.cache.request(PageId(100), false, h.collect());
	ASSERT_EQUALS(0u, h.results.size());
	h.waitForResults(1);

	ASSERT(h.results[0].ok());
	ASSERT_EQUALS("hello", h.results[0].page->rowText(0).substr(0, 5));
	ASSERT(h.cache.get(PageId(100)) == h.results[0].page);
	ASSERT_EQUALS(1, h.transport.callCount(PageId(100)));
}

unittest("PageCache: a hit is delivered at once without any fetch") {
	ExecutorSync background;
	CacheHarness h(background);
	h.transport.serve(PageId(100), makePage("hello"));
	h.cache.request(PageId(100), false, h.collect());
	h.waitForResults(1);

	h.cache.request(PageId(100), false, h.collect());
	ASSERT_EQUALS(2u, h.results.size());
	ASSERT(h.results[1].page == h.results[0].page);
	ASSERT_EQUALS(1, h.transport.callCount(PageId(100)));
}

secondclasstest("PageCache: concurrent requests for one page share a single fetch") {
	ExecutorThread background("PageFetch", 4);
	CacheHarness h(background);
	h.transport.serve(PageId(100), makePage("shared"));
	h.transport.close();

	for(int i = 0; i < 5; ++i)
		h.cache.request(PageId(100), false, h.collect());
	h.transport.waitForCalls(1);
	ASSERT(h.cache.isInflight(PageId(100)));
	h.transport.open();

	h.waitForResults(5);
	ASSERT_EQUALS(1, h.transport.callCount(PageId(100)));
	for(auto& r : h.results)
		ASSERT(r.page == h.results[0].page);
	ASSERT(!h.cache.isInflight(PageId(100)));
}

secondclasstest("PageCache: different pages are fetched concurrently") {
	ExecutorThread background("PageFetch", 2);
	CacheHarness h(background);
	h.transport.serve(PageId(100), makePage("a"));
	h.transport.serve(PageId(200), makePage("b"));
	h.transport.close();

	h.cache.request(PageId(100), false, h.collect());
	h.cache.request(PageId(200), false, h.collect());
	h.transport.waitForCalls(2); // both are blocked in the transport at the same time
	h.transport.open();

	h.waitForResults(2);
	ASSERT(h.results[0].ok() && h.results[1].ok());
}

unittest("PageCache: failures are delivered, not stored") {
	ExecutorSync background;
	CacheHarness h(background);
	h.transport.fail(PageId(150), ErrorKind::ServerError, 503);

	h.cache.request(PageId(150), false, h.collect());
	h.waitForResults(1);
	ASSERT(!h.results[0].ok());
	ASSERT(h.results[0].error.kind == ErrorKind::ServerError);
	ASSERT_EQUALS(503, h.results[0].error.status);
	ASSERT(h.cache.get(PageId(150)) == nullptr);
	ASSERT_EQUALS(0u, h.cache.size());
}

unittest("PageCache: bypassing the cache fetches again") {
	ExecutorSync background;
	CacheHarness h(background);
	h.transport.serve(PageId(100), makePage("v1"));
	h.cache.request(PageId(100), false, h.collect());
	h.waitForResults(1);

	h.transport.serve(PageId(100), makePage("v2"));
	h.cache.request(PageId(100), true, h.collect());
	h.waitForResults(2);
	ASSERT_EQUALS(2, h.transport.callCount(PageId(100)));
	ASSERT_EQUALS("v2", h.results[1].page->rowText(0).substr(0, 2));
	ASSERT(h.cache.get(PageId(100)) == h.results[1].page);
}

unittest("PageCache: an unusable refresh keeps the previous page") {
	ExecutorSync background;
	CacheHarness h(background);
	h.transport.serve(PageId(100), makePage("good"));
	h.cache.request(PageId(100), false, h.collect());
	h.waitForResults(1);
	auto const good = h.results[0].page;

	std::string tooLong;
	for(int i = 0; i < 30; ++i)
		tooLong += "line\n";
	h.transport.serve(PageId(100), makePage(tooLong));
	h.cache.invalidate(PageId(100));
	h.cache.request(PageId(100), true, h.collect());
	h.waitForResults(2);

	ASSERT(h.results[1].ok());
	ASSERT(h.results[1].stale);
	ASSERT(h.results[1].page == good);

	h.transport.serve(PageId(100), "bad &entity");
	h.cache.request(PageId(100), true, h.collect());
	h.waitForResults(3);
	ASSERT(h.results[2].stale);
	ASSERT(h.results[2].page == good);
}

unittest("PageCache: an unusable page without a previous version fails") {
	ExecutorSync background;
	CacheHarness h(background);
	h.transport.serve(PageId(100), "bad &entity");
	h.transport.serve(PageId(101), "<title>empty</title>");

	h.cache.request(PageId(100), false, h.collect());
	h.cache.request(PageId(101), false, h.collect());
	h.waitForResults(2);
	ASSERT(h.results[0].error.kind == ErrorKind::MalformedEncoding);
	ASSERT(h.results[1].error.kind == ErrorKind::NoContent);
}

unittest("PageCache: transport failures don't fall back to the previous page") {
	ExecutorSync background;
	CacheHarness h(background);
	h.transport.serve(PageId(100), makePage("good"));
	h.cache.request(PageId(100), false, h.collect());
	h.waitForResults(1);

	h.transport.fail(PageId(100), ErrorKind::Timeout);
	h.cache.request(PageId(100), true, h.collect());
	h.waitForResults(2);
	ASSERT(!h.results[1].ok());
	ASSERT(h.results[1].error.kind == ErrorKind::Timeout);
}

}
