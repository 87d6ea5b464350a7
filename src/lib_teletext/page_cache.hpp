#pragma once

#include "inflight.hpp"
#include "markup_decoder.hpp"
#include "page_parser.hpp"
#include "page_store.hpp"
#include "transport.hpp"
#include "lib_utils/executor.hpp"
#include <memory>

namespace Teletext {

// Transport, then decoder, then parser: one complete page load.
class PageLoader {
	public:
		PageLoader(ITransport& transport, PageParser const& parser);

		// throws Error
		PagePtr load(PageId id);

	private:
		ITransport& m_transport;
		PageParser const& m_parser;
};

// What the navigation needs from the page source.
struct IPageSource {
	virtual ~IPageSource() = default;

	// Calls 'done' exactly once, with the page or the failure. Cached pages are
	// delivered before request() returns, unless 'bypassCache' is set.
	virtual void request(PageId id, bool bypassCache, FetchCallback done) = 0;

	// the next request for 'id' fetches it again
	virtual void invalidate(PageId id) = 0;
};

// Serves pages from the store, fetching the missing ones on the background
// executor. Concurrent requests for the same page share a single fetch.
// Completions are delivered through the completion executor.
class PageCache : public IPageSource {
	public:
		PageCache(std::unique_ptr<IPageStore> store, std::unique_ptr<IInflightTable> inflight, PageLoader& loader,
		    IExecutor& background, IExecutor& completion);

		void request(PageId id, bool bypassCache, FetchCallback done) override;
		void invalidate(PageId id) override;

		// cached page, nullptr on miss
		PagePtr get(PageId id);
		void put(PageId id, PagePtr page);

		size_t size() const;
		bool isInflight(PageId id) const;

	private:
		void runPipeline(PageId id);

		std::unique_ptr<IPageStore> const m_store;
		std::unique_ptr<IInflightTable> const m_inflight;
		PageLoader& m_loader;
		IExecutor& m_background;
		IExecutor& m_completion;
};

}
