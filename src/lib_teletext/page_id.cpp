#include "page_id.hpp"
#include "error.hpp"
#include "lib_utils/format.hpp"
#include <cctype>

namespace Teletext {

PageId::PageId(int number, int subpage) : m_number(number), m_subpage(subpage) {
	if(!isValidPageNumber(number))
		throw Error(ErrorKind::InvalidPage, format("page number %s is out of range [%s, %s]", number, MinPageNumber, MaxPageNumber));
	if(subpage < 1 || subpage > MaxSubpage)
		throw Error(ErrorKind::InvalidPage, format("subpage %s is out of range [1, %s]", subpage, MaxSubpage));
}

bool isValidPageNumber(int number) {
	return number >= MinPageNumber && number <= MaxPageNumber;
}

namespace {
// parses s[pos..] as an unsigned decimal of at most 'maxDigits' digits
bool parseDigits(std::string const& s, size_t& pos, int maxDigits, int& value) {
	auto const start = pos;
	value = 0;
	while(pos < s.size() && isdigit((unsigned char)s[pos])) {
		if((int)(pos - start) >= maxDigits)
			return false;
		value = value * 10 + (s[pos] - '0');
		++pos;
	}
	return pos > start;
}
}

PageId parsePageId(std::string const& text) {
	auto fail = [&]() {
		return Error(ErrorKind::InvalidPage, "can't parse page '" + text + "'");
	};

	size_t pos = 0;
	if(pos < text.size() && (text[pos] == 'P' || text[pos] == 'p'))
		++pos;

	auto const numberStart = pos;
	int number = 0;
	if(!parseDigits(text, pos, 3, number) || pos - numberStart != 3)
		throw fail();

	int subpage = 1;
	if(pos < text.size()) {
		auto const sep = text[pos++];
		if(sep != '/' && sep != '_' && sep != '#')
			throw fail();
		if(!parseDigits(text, pos, 4, subpage) || pos != text.size())
			throw fail();
	}

	return PageId(number, subpage);
}

std::string toString(PageId id) {
	return format("%s/%s", id.number(), id.subpage());
}

std::ostream& operator<<(std::ostream& o, PageId id) {
	return o << toString(id);
}

}
