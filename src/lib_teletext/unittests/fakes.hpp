#pragma once

#include "lib_teletext/error.hpp"
#include "lib_teletext/transport.hpp"
#include "lib_utils/clock.hpp"
#include <condition_variable>
#include <map>
#include <mutex>
#include <string>

namespace Teletext {

struct FakeClock : IClock {
	Fraction now() const override {
		std::unique_lock<std::mutex> lock(mutex);
		return current;
	}

	void sleep(Fraction time) const override {
		advance(time);
	}

	void advance(Fraction time) const {
		std::unique_lock<std::mutex> lock(mutex);
		current = current + time;
	}

	mutable std::mutex mutex;
	mutable Fraction current = Fraction(1000, 1);
};

// Serves canned payloads and failures. When closed, fetch() blocks until open() is called.
struct FakeTransport : ITransport {
	std::string fetch(PageId id) override {
		std::unique_lock<std::mutex> lock(mutex);
		calls[id]++;
		totalCalls++;
		gateChanged.notify_all();
		gateChanged.wait(lock, [&]() {
			return !closed;
		});

		auto failure = failures.find(id);
		if(failure != failures.end()) {
			auto const f = failure->second;
			if(f.remaining > 0 && --failure->second.remaining == 0)
				failures.erase(failure);
			throw Error(f.kind, "fake failure", f.status);
		}

		auto page = pages.find(id);
		if(page == pages.end())
			throw Error(ErrorKind::NotFound, "no such page: " + toString(id));
		return page->second;
	}

	void serve(PageId id, std::string payload) {
		std::unique_lock<std::mutex> lock(mutex);
		pages[id] = payload;
	}

	// 'times' <= 0 fails forever
	void fail(PageId id, ErrorKind kind, int status = 0, int times = 0) {
		std::unique_lock<std::mutex> lock(mutex);
		failures[id] = { kind, status, times };
	}

	void close() {
		std::unique_lock<std::mutex> lock(mutex);
		closed = true;
	}

	void open() {
		std::unique_lock<std::mutex> lock(mutex);
		closed = false;
		gateChanged.notify_all();
	}

	// waits until 'count' fetches have started
	void waitForCalls(int count) {
		std::unique_lock<std::mutex> lock(mutex);
		gateChanged.wait(lock, [&]() {
			return totalCalls >= count;
		});
	}

	int callCount(PageId id) {
		std::unique_lock<std::mutex> lock(mutex);
		return calls[id];
	}

	struct Failure {
		ErrorKind kind;
		int status;
		int remaining;
	};

	std::mutex mutex;
	std::condition_variable gateChanged;
	bool closed = false;
	int totalCalls = 0;
	std::map<PageId, std::string> pages;
	std::map<PageId, Failure> failures;
	std::map<PageId, int> calls;
};

// a page of plain text lines, with an optional subpage count
inline std::string makePage(std::string const& body, int subpages = 1) {
	std::string r = "<html><head><title>Test</title>";
	if(subpages > 1)
		r += "<meta name=\"subpages\" content=\"" + std::to_string(subpages) + "\">";
	r += "</head><body><pre>" + body + "</pre></body></html>";
	return r;
}

}
