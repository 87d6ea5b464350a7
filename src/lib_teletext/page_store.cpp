#include "page_store.hpp"
#include "lib_utils/format.hpp"
#include "lib_utils/log.hpp"
#include <list>
#include <mutex>
#include <unordered_map>

namespace Teletext {

namespace {

struct LruPageStore : IPageStore {
	LruPageStore(PageStoreConfig const& cfg) : cfg(cfg) {
		if(cfg.maxEntries < 1)
			throw std::runtime_error(format("page store: invalid capacity %s", cfg.maxEntries));
		if(!cfg.clock)
			throw std::runtime_error("page store: no clock");
	}

	PagePtr get(PageId id) override {
		std::unique_lock<std::mutex> lock(mutex);
		auto i = entries.find(id);
		if(i == entries.end())
			return nullptr;

		auto& entry = i->second;
		if(entry.invalidated)
			return nullptr;
		if(cfg.clock->now() >= entry.expiresAt) {
			logMsg(Debug, "PageStore", "page %s expired", toString(id));
			return nullptr;
		}

		touch(entry);
		return entry.page;
	}

	void put(PageId id, PagePtr page) override {
		if(!page)
			throw std::runtime_error("page store: can't store a null page");

		std::unique_lock<std::mutex> lock(mutex);
		auto const expiresAt = cfg.clock->now() + cfg.ttl;
		auto i = entries.find(id);
		if(i != entries.end()) {
			i->second.page = page;
			i->second.expiresAt = expiresAt;
			i->second.invalidated = false;
			touch(i->second);
			return;
		}

		order.push_front(id);
		entries.emplace(id, Entry { page, expiresAt, false, order.begin() });

		while((int)entries.size() > cfg.maxEntries) {
			auto const victim = order.back();
			order.pop_back();
			entries.erase(victim);
			logMsg(Debug, "PageStore", "evicted page %s", toString(victim));
		}
	}

	void invalidate(PageId id) override {
		std::unique_lock<std::mutex> lock(mutex);
		auto i = entries.find(id);
		if(i != entries.end())
			i->second.invalidated = true;
	}

	PagePtr lastKnownGood(PageId id) override {
		std::unique_lock<std::mutex> lock(mutex);
		auto i = entries.find(id);
		return i == entries.end() ? nullptr : i->second.page;
	}

	size_t size() const override {
		std::unique_lock<std::mutex> lock(mutex);
		return entries.size();
	}

private:
	struct Entry {
		PagePtr page;
		Fraction expiresAt;
		bool invalidated;
		std::list<PageId>::iterator position;
	};

	void touch(Entry& entry) {
		order.splice(order.begin(), order, entry.position);
	}

	PageStoreConfig const cfg;
	mutable std::mutex mutex;
	std::list<PageId> order; // most recently used first
	std::unordered_map<PageId, Entry, PageIdHash> entries;
};

}

std::unique_ptr<IPageStore> createPageStore(PageStoreConfig const& cfg) {
	return std::make_unique<LruPageStore>(cfg);
}

}
