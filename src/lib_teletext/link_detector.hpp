#pragma once

#include <string>
#include <vector>

namespace Teletext {

struct NumberMatch {
	int start;
	int length;
	int number;
};

// Finds bare page numbers in one row of text: runs of exactly 3 ASCII digits
// in [100, 999]. A run glued to another number by '.', ',' or ':' ("12.30",
// "1,250", "21:00") is part of a time or a quantity, and is skipped.
std::vector<NumberMatch> findPageNumbers(std::u32string const& text);

}
