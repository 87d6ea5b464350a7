#include "tests/tests.hpp"
#include "lib_teletext/link_detector.hpp"

using namespace Tests;
using namespace Teletext;

namespace {

std::vector<int> numbers(std::u32string const& text) {
	std::vector<int> r;
	for(auto& m : findPageNumbers(text))
		r.push_back(m.number);
	return r;
}

unittest("LinkDetector: bare 3-digit numbers") {
	auto const matches = findPageNumbers(U"Uutiset 102 Urheilu 201");
	ASSERT_EQUALS(2u, matches.size());
	ASSERT_EQUALS(8, matches[0].start);
	ASSERT_EQUALS(3, matches[0].length);
	ASSERT_EQUALS(102, matches[0].number);
	ASSERT_EQUALS(20, matches[1].start);
	ASSERT_EQUALS(201, matches[1].number);
}

unittest("LinkDetector: only complete runs of exactly 3 digits in range") {
	ASSERT_EQUALS(std::vector<int>(), numbers(U"12 1999 099 000"));
	ASSERT_EQUALS(std::vector<int>({100, 999}), numbers(U"100 999"));
	ASSERT_EQUALS(std::vector<int>({300, 301}), numbers(U"300-301"));
	ASSERT_EQUALS(std::vector<int>({235}), numbers(U"P235"));
	ASSERT_EQUALS(std::vector<int>({470}), numbers(U"s.470"));
}

unittest("LinkDetector: times and quantities are not page numbers") {
	ASSERT_EQUALS(std::vector<int>(), numbers(U"klo 12.300 ja 1,250 sekä 21:000"));
	ASSERT_EQUALS(std::vector<int>(), numbers(U"205.5"));
	ASSERT_EQUALS(std::vector<int>({205}), numbers(U"205. sivu"));
	ASSERT_EQUALS(std::vector<int>({120}), numbers(U"ks. 120, 12"));
}

unittest("LinkDetector: empty text") {
	ASSERT_EQUALS(0u, findPageNumbers(U"").size());
}

}
