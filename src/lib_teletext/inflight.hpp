#pragma once

#include "error.hpp"
#include "page.hpp"
#include <functional>
#include <memory>
#include <vector>

namespace Teletext {

struct FetchResult {
	PagePtr page;     // null on failure
	ErrorInfo error;  // meaningful when 'page' is null
	bool stale = false; // a previously cached page, served because the fresh one was unusable

	bool ok() const {
		return page != nullptr;
	}
};

typedef std::function<void(FetchResult const&)> FetchCallback;

// Tracks the pages being fetched, and who waits for them.
struct IInflightTable {
	virtual ~IInflightTable() = default;

	// Registers 'waiter' for 'id'. Returns true when no fetch of 'id' was in
	// flight: the caller must then start one, and call complete() at the end.
	virtual bool attach(PageId id, FetchCallback waiter) = 0;

	// clears the in-flight marker, returns the waiters to notify
	virtual std::vector<FetchCallback> complete(PageId id) = 0;

	virtual bool isInflight(PageId id) const = 0;
};

std::unique_ptr<IInflightTable> createInflightTable();

}
