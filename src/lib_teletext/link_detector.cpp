#include "link_detector.hpp"
#include "page_id.hpp"

namespace Teletext {

namespace {
bool isDigit(char32_t c) {
	return c >= '0' && c <= '9';
}

bool isJoiner(char32_t c) {
	return c == '.' || c == ',' || c == ':';
}
}

std::vector<NumberMatch> findPageNumbers(std::u32string const& text) {
	std::vector<NumberMatch> r;
	int const size = (int)text.size();
	int i = 0;
	while(i < size) {
		if(!isDigit(text[i])) {
			++i;
			continue;
		}

		auto const start = i;
		int number = 0;
		while(i < size && isDigit(text[i])) {
			number = number * 10 + (int)(text[i] - '0');
			if(number > MaxPageNumber * 10)
				number = MaxPageNumber * 10; // saturate, long runs are rejected anyway
			++i;
		}
		auto const length = i - start;

		if(length != 3 || !isValidPageNumber(number))
			continue;
		if(start >= 2 && isJoiner(text[start - 1]) && isDigit(text[start - 2]))
			continue;
		if(i + 1 < size && isJoiner(text[i]) && isDigit(text[i + 1]))
			continue;

		r.push_back({ start, length, number });
	}
	return r;
}

}
