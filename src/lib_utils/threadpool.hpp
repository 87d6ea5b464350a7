#pragma once

#include "log.hpp"
#include "queue.hpp"
#include "tools.hpp" // enforce
#include <exception>
#include <functional>
#include <string>
#include <thread>
#include <vector>

class ThreadPool {
	public:
		ThreadPool(const std::string &name = "", int threadCount = std::thread::hardware_concurrency())
			: name(name) {
			if (threadCount < 1)
				threadCount = 1;
			for (int i = 0; i < threadCount; ++i) {
				threads.push_back(std::thread(&ThreadPool::run, this));
			}
		}

		~ThreadPool() {
			for(auto& t : threads) {
				(void)t;
				workQueue.push(nullptr);
			}
			for(auto& t : threads) {
				t.join();
			}
		}

		void submit(std::function<void()> f) {
			enforce(f != nullptr, "ThreadPool: can't submit an empty task");
			workQueue.push(f);
		}

	private:
		ThreadPool(const ThreadPool&) = delete;
		ThreadPool& operator=(const ThreadPool&) = delete;

		void run() {
			while (auto task = workQueue.pop()) {
				try {
					task();
				} catch (std::exception const& e) {
					logMsg(Error, "ThreadPool", "%s: task failed: %s", name, e.what());
				}
			}
		}

		Queue<std::function<void(void)>> workQueue;
		std::vector<std::thread> threads;
		std::string name;
};
