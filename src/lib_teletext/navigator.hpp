#pragma once

#include "page_cache.hpp"
#include <functional>
#include <memory>
#include <vector>

namespace Teletext {

enum class NavState {
	Idle,
	Loading,
	Displaying,
	Failed,
};

const char* toString(NavState state);

// outcome of a navigation call
enum class Nav {
	Ok,        // started, or completed at once from the cache
	Unchanged, // already displayed, or already loading
	NoHistory, // nothing to go to
};

const char* toString(Nav nav);

struct ViewState {
	NavState state = NavState::Idle;
	PageId target;   // loading, displayed or failed page
	PagePtr page;    // last displayed page, kept while loading and after a failure
	ErrorInfo error; // when Failed
	bool stale = false; // 'page' is an older version served after a failed reload
};

// Navigation state machine: what is displayed, the visit history and the
// pending request. Not thread-safe: every call, and the completions of the
// page source, must happen on the same thread.
class Navigator {
	public:
		explicit Navigator(IPageSource& source);
		~Navigator();

		Nav goTo(PageId id);
		// the target of a link of the displayed page
		Nav follow(Link const& link);

		Nav back();
		Nav forward();

		// cycle through the subpages of the displayed page, without history entries
		Nav nextSubpage();
		Nav prevSubpage();

		// adjacent page numbers, wrapping from 999 to 100, as history visits
		Nav nextPage();
		Nav prevPage();

		// Fetches again, bypassing the cache: the failed request when Failed,
		// the pending one when Loading, the displayed page otherwise.
		Nav reload();

		// shows the displayed page again, through the cache
		Nav refresh();

		ViewState const& view() const {
			return m_view;
		}

		std::vector<PageId> const& history() const {
			return m_history;
		}

		// index in history() of the current visit, -1 when the history is empty
		int historyCursor() const {
			return m_cursor;
		}

		// called after every state change
		void setListener(std::function<void(ViewState const&)> listener) {
			m_listener = std::move(listener);
		}

	private:
		enum class Effect {
			Visit,  // new history entry, drops the forward entries
			Move,   // moves the history cursor to 'historyIndex'
			InPlace,
		};

		struct Request {
			PageId target;
			Effect effect;
			int historyIndex;
		};

		void start(Request const& request, bool bypassCache);
		void onFetched(PageId target, FetchResult const& result);
		void commit(Request const& request);
		void notify();
		Nav stepPage(int delta);
		Nav stepSubpage(int delta);

		IPageSource& m_source;
		ViewState m_view;
		std::vector<PageId> m_history;
		int m_cursor = -1;

		bool m_pending = false;
		Request m_request {}; // pending, or the one that failed
		std::function<void(ViewState const&)> m_listener;

		// completions arriving after our destruction are dropped
		std::shared_ptr<Navigator*> m_self;
};

}
