#pragma once

#include "lib_utils/queue.hpp"
#include <atomic>
#include <istream>
#include <memory>
#include <string>
#include <thread>

// Lines read from a blocking stream on a detached thread.
// The thread shares this state, so it may outlive whoever started it.
struct LineReader {
	Queue<std::string> lines;
	std::atomic<bool> stop { false }; // no more lines are queued once set
};

// 'endMarker' is queued when 'in' reaches its end.
// 'in' must outlive the thread: use it with std::cin.
inline std::shared_ptr<LineReader> startLineReader(std::istream& in, std::string const& endMarker) {
	auto reader = std::make_shared<LineReader>();
	std::thread([reader, &in, endMarker]() {
		std::string line;
		while(!reader->stop && std::getline(in, line))
			reader->lines.push(line);
		if(!reader->stop)
			reader->lines.push(endMarker);
	}).detach();
	return reader;
}
