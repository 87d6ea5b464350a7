#include "tests/tests.hpp"
#include "lib_appcommon/line_reader.hpp"
#include <chrono>
#include <sstream>

namespace {

unittest("LineReader: lines then the end marker") {
	static std::istringstream input("100\nb\n\n");
	auto reader = startLineReader(input, "q");
	ASSERT_EQUALS("100", reader->lines.pop());
	ASSERT_EQUALS("b", reader->lines.pop());
	ASSERT_EQUALS("", reader->lines.pop());
	ASSERT_EQUALS("q", reader->lines.pop());
}

secondclasstest("LineReader: the thread keeps the queue alive after the caller drops it") {
	static std::istringstream input("a\nb\n");
	std::weak_ptr<LineReader> weak;
	{
		auto reader = startLineReader(input, "q");
		weak = reader;
	}

	// released by the thread once the input is exhausted
	for(int i = 0; i < 200 && !weak.expired(); ++i)
		std::this_thread::sleep_for(std::chrono::milliseconds(10));
	ASSERT(weak.expired());
}

}
