#include <iostream>
#include <stdexcept>
#include <cstdlib>
#include <csignal>
#include <climits>
#include <algorithm> // sort
#include "tests.hpp"
#include "lib_utils/log.hpp"

namespace {

struct UnitTest {
	void (*fn)();
	std::string name;

	// A "first class" test must be fast, isolated (no network, no real
	// clock), repeatable and self-validating.
	// Second class tests may sleep, spawn threads or be slow: they only run
	// with '--second-class'.
	int type; // 0:first class, 1:second class

	// for sorting
	std::string file;
	int line;
};

std::vector<UnitTest>& allTests() {
	static std::vector<UnitTest> all;
	return all;
}

struct Filter {
	int minIdx = 0;
	int maxIdx = INT_MAX;
	bool noSecondClass = true;
};

void listAll() {
	int i=0;
	for (auto& test : allTests())
		std::cout << "Test #" << i++ << ": " << test.name << std::endl;
}

bool startsWith(std::string s, std::string prefix) {
	return s.substr(0, prefix.size()) == prefix;
}

bool matches(Filter filter, int idx) {
	if(idx < filter.minIdx)
		return false;
	if(idx > filter.maxIdx)
		return false;
	if(filter.noSecondClass && allTests()[idx].type == 1)
		return false;
	if(startsWith(allTests()[idx].name, "[DISABLED]"))
		return false;
	return true;
}

int RunAll(Filter filter) {
	int count = 0;
	for(int i=0; i < (int)allTests().size(); ++i) {
		if(matches(filter, i)) {
			std::cout << "#" << i << ": " << allTests()[i].name << std::endl;
			allTests()[i].fn();
			++count;
		}
	}
	return count;
}

void SortTests() {
	auto byName = [](UnitTest const& a, UnitTest const& b) -> bool {
		if(a.file != b.file)
			return a.file < b.file;
		return a.line < b.line;
	};
	std::sort(allTests().begin(), allTests().end(), byName);
}
}

namespace Tests {

void Fail(char const* file, int line, const char* msg) {
	std::cerr << "TEST FAILED: " << file << "(" << line << "): " << msg << std::endl;
	std::raise(SIGABRT);
}

int RegisterTest(void (*fn)(), const char* testName, int type, const char* filename, int line) {
	UnitTest test {};
	test.fn = fn;
	test.name = testName;
	test.type = type;
	test.file = filename;
	test.line = line;
	allTests().push_back(test);
	return 0;
}
}

int main(int argc, const char* argv[]) {
	int i = 1;
	auto popWord = [&]() -> std::string {
		if(i >= argc)
			throw std::runtime_error("unexpected end of command line");
		return argv[i++];
	};

	SortTests();

	Filter filter;

	// keep the test output readable, a test may raise the level locally
	setGlobalLogLevel(Quiet);

	while(i < argc) {
		auto const word = popWord();

		if(word == "--list" || word == "-l") {
			listAll();
			return 0;
		} else if(word == "--only") {
			auto idx = atoi(popWord().c_str());
			filter.minIdx = idx;
			filter.maxIdx = idx;
			filter.noSecondClass = false;
		} else if(word == "--range") {
			filter.minIdx =  atoi(popWord().c_str());
			filter.maxIdx =  atoi(popWord().c_str());
		} else if(word == "--second-class") {
			filter.noSecondClass = false;
		} else if(word == "--verbose") {
			setGlobalLogLevel(Debug);
		} else {
			std::cerr << "unknown option: " << word << std::endl;
			return 1;
		}
	}

	auto const count = RunAll(filter);
	std::cout << count << " test(s) passed" << std::endl;
	return 0;
}
