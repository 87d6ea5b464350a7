#pragma once

#include "page.hpp"
#include "lib_utils/clock.hpp"
#include <cstddef>
#include <memory>

namespace Teletext {

// Thread-safe storage of parsed pages.
struct IPageStore {
	virtual ~IPageStore() = default;

	// Returns nullptr when the page is absent, expired or invalidated.
	// A hit makes the entry the most recently used one.
	virtual PagePtr get(PageId id) = 0;

	virtual void put(PageId id, PagePtr page) = 0;

	// the next get() misses, the page stays available to lastKnownGood()
	virtual void invalidate(PageId id) = 0;

	// the last page stored under 'id', even expired or invalidated
	virtual PagePtr lastKnownGood(PageId id) = 0;

	virtual size_t size() const = 0;
};

struct PageStoreConfig {
	Fraction ttl = Fraction(300, 1); // seconds, from the last put()
	int maxEntries = 64;
	std::shared_ptr<IClock> clock = g_SystemClock;
};

// least recently used entries are evicted beyond 'maxEntries'
std::unique_ptr<IPageStore> createPageStore(PageStoreConfig const& cfg);

}
