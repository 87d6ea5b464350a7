#include "inflight.hpp"
#include <mutex>
#include <unordered_map>

namespace Teletext {

namespace {

struct InflightTable : IInflightTable {
	bool attach(PageId id, FetchCallback waiter) override {
		std::unique_lock<std::mutex> lock(mutex);
		auto& waiters = table[id];
		waiters.push_back(std::move(waiter));
		return waiters.size() == 1;
	}

	std::vector<FetchCallback> complete(PageId id) override {
		std::unique_lock<std::mutex> lock(mutex);
		std::vector<FetchCallback> r;
		auto i = table.find(id);
		if(i != table.end()) {
			r = std::move(i->second);
			table.erase(i);
		}
		return r;
	}

	bool isInflight(PageId id) const override {
		std::unique_lock<std::mutex> lock(mutex);
		return table.find(id) != table.end();
	}

private:
	mutable std::mutex mutex;
	std::unordered_map<PageId, std::vector<FetchCallback>, PageIdHash> table;
};

}

std::unique_ptr<IInflightTable> createInflightTable() {
	return std::make_unique<InflightTable>();
}

}
