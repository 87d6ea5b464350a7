#include "tests/tests.hpp"
#include "lib_utils/fraction.hpp"

using namespace Tests;

unittest("Fraction: comparison, natural numbers") {
	ASSERT(Fraction(1, 10) <= 100);
	ASSERT(Fraction(100, 2) > 25);
	ASSERT(Fraction(31, 10) > 3);
}

unittest("Fraction: comparison, relative numbers") {
	ASSERT(Fraction(-1, 1) <= 100);
	ASSERT(Fraction(1, -1) < 0);
	ASSERT(Fraction(-3, -4) > 0);
}

unittest("Fraction: timestamps in milliseconds") {
	auto const t = fromMs(1500);
	ASSERT_EQUALS(3, t.num);
	ASSERT_EQUALS(2, t.den);
	ASSERT(t + Fraction(300) == fromMs(301500));
	ASSERT(fromMs(2000) - t == fromMs(500));
	ASSERT_EQUALS(1.5, (double)t);
}
