#pragma once

#include "queue.hpp"
#include "threadpool.hpp"
#include <functional>
#include <memory>

// Where a unit of work runs. The fetch pipeline is handed one executor for the
// background work and another one for delivering completions to its owner.
struct IExecutor {
	virtual ~IExecutor() {}
	virtual void call(const std::function<void()> &fn) = 0;
};

//synchronous calls
class ExecutorSync : public IExecutor {
	public:
		void call(const std::function<void()> &fn) override {
			fn();
		}
};

//tasks occur in a pool of 'threadCount' threads
class ExecutorThread : public IExecutor {
	public:
		ExecutorThread(const std::string &name, int threadCount = 1) : m_threadPool(name, threadCount) {
		}

		void call(const std::function<void()> &fn) override {
			m_threadPool.submit(fn);
		}

	private:
		ThreadPool m_threadPool;
};

//tasks are queued until the owner of the queue runs them from its own loop
class ExecutorQueue : public IExecutor {
	public:
		void call(const std::function<void()> &fn) override {
			m_tasks.push(fn);
		}

		// runs everything queued so far, returns the number of tasks run
		int runPending() {
			int count = 0;
			std::function<void()> task;
			while (m_tasks.tryPop(task)) {
				task();
				++count;
			}
			return count;
		}

		// waits up to 'timeout' for one task, then runs whatever else is queued
		template<typename Rep, typename Period>
		int runFor(std::chrono::duration<Rep, Period> timeout) {
			std::function<void()> task;
			if (!m_tasks.tryPopFor(task, timeout))
				return 0;
			task();
			return 1 + runPending();
		}

	private:
		Queue<std::function<void()>> m_tasks;
};
