#include "tests/tests.hpp"
#include "lib_utils/format.hpp"
#include "lib_utils/log.hpp"
#include "lib_utils/tools.hpp"
#include "lib_utils/utf8.hpp"
#include <vector>

using namespace Tests;

namespace {

unittest("format: one argument") {
	ASSERT_EQUALS("45", format("%s", 45));
}

unittest("format: one uint8_t argument") {
	ASSERT_EQUALS("45", format("%s", (uint8_t)45));
}

unittest("format: one char argument") {
	ASSERT_EQUALS("A", format("%s", 'A'));
}

unittest("format: string argument") {
	std::string s = "Hello";
	ASSERT_EQUALS("Hello, world", format("%s, world", s));
}

unittest("format: percent escape") {
	ASSERT_EQUALS("100%", format("100%%"));
	ASSERT_EQUALS("7% of 100", format("%s%% of %s", 7, 100));
}

unittest("format: vector argument") {
	std::vector<int> v { 1, 2, 3 };
	ASSERT_EQUALS("[1, 2, 3]", format("%s", v));
}

unittest("enforce") {
	enforce(true, "never thrown");
	ASSERT_THROWN(enforce(false, "thrown"));
}

unittest("log level parsing") {
	ASSERT_EQUALS((int)Debug, (int)parseLogLevel("debug"));
	ASSERT_EQUALS((int)Error, (int)parseLogLevel("error"));
	ASSERT_THROWN(parseLogLevel("verbose"));
}

unittest("utf8: round trip of mixed scripts") {
	auto const s = std::string("P100 \xc3\xa4\xc3\xb6 \xe2\x82\xac \xf0\x9f\x98\x80");
	auto const u = fromUtf8(s);
	ASSERT_EQUALS(11u, u.size());
	ASSERT(U'\u00e4' == u[5]);
	ASSERT(U'\U0001F600' == u[10]);
	ASSERT_EQUALS(s, toUtf8(u));
}

unittest("utf8: invalid input is rejected") {
	ASSERT_THROWN(fromUtf8("abc\xc3"));             // truncated
	ASSERT_THROWN(fromUtf8("\xc0\xaf"));            // overlong
	ASSERT_THROWN(fromUtf8("\x80"));                // stray continuation byte
	ASSERT_THROWN(fromUtf8("\xe2\x28\xa1"));        // bad continuation byte
	ASSERT_THROWN(fromUtf8("\xed\xa0\x80"));        // surrogate
}

}
