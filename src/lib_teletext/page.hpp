#pragma once

#include "page_id.hpp"
#include "lib_utils/fraction.hpp"
#include "lib_utils/tools.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace Teletext {

// the 8 colors of the teletext palette
enum class Color : uint8_t {
	Black,
	Red,
	Green,
	Yellow,
	Blue,
	Magenta,
	Cyan,
	White,
};

const char* toString(Color color);

// Accepts palette names ("red", "YELLOW"), and "#rgb"/"#rrggbb" snapped to the
// palette. Returns false when 'name' isn't a color.
bool parseColor(std::string const& name, Color& color);

enum class CellFlags : uint8_t {
	None = 0,
	Bold = 1,
	Blink = 2,
	DoubleHeight = 4,
};

inline bool hasFlag(CellFlags flags, CellFlags flag) {
	return (flags & flag) == flag;
}

struct Cell {
	char32_t character = U' ';
	Color foreground = Color::White;
	Color background = Color::Black;
	CellFlags flags = CellFlags::None;

	bool operator==(Cell const& other) const {
		return character == other.character && foreground == other.foreground
		    && background == other.background && flags == other.flags;
	}
	bool operator!=(Cell const& other) const {
		return !(*this == other);
	}
};

// Fixed size matrix of cells, initialized to blanks.
class Grid {
	public:
		// throws Error(LayoutOverflow) on non-positive dimensions
		Grid(int rows, int cols);

		int rows() const {
			return m_rows;
		}
		int cols() const {
			return m_cols;
		}

		Cell& at(int row, int col);
		Cell const& at(int row, int col) const;

		std::u32string rowText(int row) const;

		bool operator==(Grid const& other) const {
			return m_rows == other.m_rows && m_cols == other.m_cols && m_cells == other.m_cells;
		}

	private:
		int m_rows, m_cols;
		std::vector<Cell> m_cells;
};

// A selectable region of one grid row: columns [colStart, colEnd).
struct Link {
	PageId target;
	int row = 0;
	int colStart = 0;
	int colEnd = 0;
	bool explicitAnchor = false; // from markup, as opposed to a detected page number

	bool contains(int r, int c) const {
		return r == row && c >= colStart && c < colEnd;
	}

	bool operator==(Link const& other) const {
		return target == other.target && row == other.row && colStart == other.colStart
		    && colEnd == other.colEnd && explicitAnchor == other.explicitAnchor;
	}
};

// A fully laid out page. Pages are never modified once built, they are shared
// between the cache and whoever displays them.
struct Page {
	Page(PageId id, Grid grid, int subpageCount, std::vector<Link> links, Fraction fetchedAt, std::string title = "");

	PageId const id;
	Grid const grid;
	int const subpageCount;
	std::vector<Link> const links; // ordered by row, then column
	Fraction const fetchedAt;
	std::string const title; // UTF-8, may be empty

	// returns nullptr when no link covers the cell
	Link const* linkAt(int row, int col) const;

	// UTF-8 text of one row
	std::string rowText(int row) const;

	bool operator==(Page const& other) const;
};

typedef std::shared_ptr<const Page> PagePtr;

}
