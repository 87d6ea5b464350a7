#pragma once

#include <cstddef>
#include <ostream>
#include <string>

namespace Teletext {

const int MinPageNumber = 100;
const int MaxPageNumber = 999;
const int MaxSubpage = 9999;

// Identifies one teletext page: a 3-digit page number and a subpage (1-based).
// Both are validated on construction, so a PageId is always in range.
class PageId {
	public:
		// throws Error(InvalidPage)
		PageId(int number = MinPageNumber, int subpage = 1);

		int number() const {
			return m_number;
		}

		int subpage() const {
			return m_subpage;
		}

		bool operator==(PageId const& other) const {
			return m_number == other.m_number && m_subpage == other.m_subpage;
		}

		bool operator!=(PageId const& other) const {
			return !(*this == other);
		}

		bool operator<(PageId const& other) const {
			if(m_number != other.m_number)
				return m_number < other.m_number;
			return m_subpage < other.m_subpage;
		}

	private:
		int m_number;
		int m_subpage;
};

struct PageIdHash {
	size_t operator()(PageId const& id) const {
		return (size_t)id.number() * (MaxSubpage + 1) + id.subpage();
	}
};

bool isValidPageNumber(int number);

// Accepts "200", "P200", "200/2", "200_0002" and "200#2".
// Throws Error(InvalidPage) on anything else.
PageId parsePageId(std::string const& text);

// "200/2"
std::string toString(PageId id);

std::ostream& operator<<(std::ostream& o, PageId id);

}
