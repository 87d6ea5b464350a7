#include "page_cache.hpp"
#include "error.hpp"
#include "lib_utils/log.hpp"

namespace Teletext {

PageLoader::PageLoader(ITransport& transport, PageParser const& parser) : m_transport(transport), m_parser(parser) {
}

PagePtr PageLoader::load(PageId id) {
	auto const raw = m_transport.fetch(id);
	auto const stream = decode(raw);
	return m_parser.parse(stream, id);
}

PageCache::PageCache(std::unique_ptr<IPageStore> store, std::unique_ptr<IInflightTable> inflight, PageLoader& loader,
    IExecutor& background, IExecutor& completion)
	: m_store(std::move(store)), m_inflight(std::move(inflight)), m_loader(loader), m_background(background), m_completion(completion) {
	enforce(m_store != nullptr, "PageCache: no store");
	enforce(m_inflight != nullptr, "PageCache: no in-flight table");
}

void PageCache::request(PageId id, bool bypassCache, FetchCallback done) {
	if(!bypassCache) {
		if(auto page = m_store->get(id)) {
			logMsg(Debug, "PageCache", "hit %s", toString(id));
			FetchResult result;
			result.page = page;
			done(result);
			return;
		}
	}

	auto& completion = m_completion;
	auto deliver = [&completion, done](FetchResult const& result) {
		completion.call([done, result]() {
			done(result);
		});
	};

	if(!m_inflight->attach(id, deliver)) {
		logMsg(Debug, "PageCache", "%s already in flight, waiting for it", toString(id));
		return;
	}

	logMsg(Debug, "PageCache", "miss %s, fetching", toString(id));
	m_background.call([this, id]() {
		runPipeline(id);
	});
}

void PageCache::runPipeline(PageId id) {
	FetchResult result;
	try {
		result.page = m_loader.load(id);
		m_store->put(id, result.page);
	} catch(Error const& e) {
		auto const unusable = e.kind() == ErrorKind::MalformedEncoding || e.kind() == ErrorKind::LayoutOverflow;
		auto stale = unusable ? m_store->lastKnownGood(id) : nullptr;
		if(stale) {
			logMsg(Warning, "PageCache", "page %s: %s, serving the previous version", toString(id), e.what());
			result.page = stale;
			result.stale = true;
		} else {
			logMsg(Warning, "PageCache", "page %s: %s", toString(id), e.what());
			result.error = e.info();
		}
	} catch(std::exception const& e) {
		logMsg(::Error, "PageCache", "page %s: unexpected failure: %s", toString(id), e.what());
		result.error.kind = ErrorKind::Network;
		result.error.message = e.what();
	}

	for(auto& waiter : m_inflight->complete(id))
		waiter(result);
}

void PageCache::invalidate(PageId id) {
	m_store->invalidate(id);
}

PagePtr PageCache::get(PageId id) {
	return m_store->get(id);
}

void PageCache::put(PageId id, PagePtr page) {
	m_store->put(id, page);
}

size_t PageCache::size() const {
	return m_store->size();
}

bool PageCache::isInflight(PageId id) const {
	return m_inflight->isInflight(id);
}

}
