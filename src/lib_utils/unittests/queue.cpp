#include "tests/tests.hpp"
#include "lib_utils/queue.hpp"
#include "lib_utils/executor.hpp"
#include <atomic>
#include <thread>

using namespace Tests;

namespace {

unittest("thread-safe queue with non-pointer types") {
	Queue<int> queue;
	const int val = 1;

	queue.push(val);
	auto data = queue.pop();
	ASSERT(data == val);

	queue.push(val);
	auto res = queue.tryPop(data);
	ASSERT((res == true) && (data == val));
	res = queue.tryPop(data);
	ASSERT(res == false);

	queue.push(val);
	ASSERT_EQUALS(1u, queue.size());
	queue.clear();
	res = queue.tryPop(data);
	ASSERT(res == false);
}

unittest("thread-safe queue can be cleared while a blocking pop() is waiting") {
	Queue<int> queue;
	auto f = [&]() {
		auto data = queue.pop();
		ASSERT_EQUALS(7, data);
	};
	std::thread tf(f);
	queue.clear();
	queue.push(7);
	tf.join();
}

unittest("thread-safe queue: tryPopFor times out on an empty queue") {
	Queue<int> queue;
	int data = 0;
	ASSERT(!queue.tryPopFor(data, std::chrono::milliseconds(1)));
	queue.push(3);
	ASSERT(queue.tryPopFor(data, std::chrono::milliseconds(1)));
	ASSERT_EQUALS(3, data);
}

unittest("executor queue: tasks only run when drained") {
	ExecutorQueue executor;
	int calls = 0;
	executor.call([&]() { calls++; });
	executor.call([&]() { calls++; });
	ASSERT_EQUALS(0, calls);
	ASSERT_EQUALS(2, executor.runPending());
	ASSERT_EQUALS(2, calls);
	ASSERT_EQUALS(0, executor.runPending());
}

unittest("executor thread: tasks run in the background and can post back") {
	ExecutorQueue mainLoop;
	std::atomic<int> ran(0);
	{
		ExecutorThread worker("test");
		for (int i = 0; i < 4; ++i) {
			worker.call([&]() {
				ran++;
				mainLoop.call([]() {});
			});
		}
	} // joins the worker
	ASSERT_EQUALS(4, ran.load());
	ASSERT_EQUALS(4, mainLoop.runPending());
}

}
