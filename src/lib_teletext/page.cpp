#include "page.hpp"
#include "error.hpp"
#include "lib_utils/format.hpp"
#include "lib_utils/utf8.hpp"
#include <cctype>

namespace Teletext {

namespace {
struct NamedColor {
	const char* name;
	Color color;
};

NamedColor const colorNames[] = {
	{ "black", Color::Black },
	{ "red", Color::Red },
	{ "green", Color::Green },
	{ "lime", Color::Green },
	{ "yellow", Color::Yellow },
	{ "blue", Color::Blue },
	{ "navy", Color::Blue },
	{ "magenta", Color::Magenta },
	{ "fuchsia", Color::Magenta },
	{ "cyan", Color::Cyan },
	{ "aqua", Color::Cyan },
	{ "white", Color::White },
};

int hexDigit(char c) {
	if(c >= '0' && c <= '9')
		return c - '0';
	c = (char)tolower((unsigned char)c);
	if(c >= 'a' && c <= 'f')
		return c - 'a' + 10;
	return -1;
}

// a channel is "on" from half intensity
bool parseHexColor(std::string const& s, Color& color) {
	int channels[3];
	if(s.size() == 7) {
		for(int i = 0; i < 3; ++i) {
			auto hi = hexDigit(s[1 + i * 2]), lo = hexDigit(s[2 + i * 2]);
			if(hi < 0 || lo < 0)
				return false;
			channels[i] = hi * 16 + lo;
		}
	} else if(s.size() == 4) {
		for(int i = 0; i < 3; ++i) {
			auto d = hexDigit(s[1 + i]);
			if(d < 0)
				return false;
			channels[i] = d * 17;
		}
	} else {
		return false;
	}

	int index = 0;
	if(channels[0] >= 0x80) index |= 1;
	if(channels[1] >= 0x80) index |= 2;
	if(channels[2] >= 0x80) index |= 4;
	color = (Color)index;
	return true;
}
}

const char* toString(Color color) {
	switch(color) {
	case Color::Black: return "black";
	case Color::Red: return "red";
	case Color::Green: return "green";
	case Color::Yellow: return "yellow";
	case Color::Blue: return "blue";
	case Color::Magenta: return "magenta";
	case Color::Cyan: return "cyan";
	case Color::White: return "white";
	}
	return "unknown";
}

bool parseColor(std::string const& name, Color& color) {
	if(!name.empty() && name[0] == '#')
		return parseHexColor(name, color);

	std::string lower;
	for(auto c : name)
		lower += (char)tolower((unsigned char)c);

	for(auto& entry : colorNames) {
		if(lower == entry.name) {
			color = entry.color;
			return true;
		}
	}
	return false;
}

Grid::Grid(int rows, int cols) : m_rows(rows), m_cols(cols) {
	if(rows <= 0 || cols <= 0)
		throw Error(ErrorKind::LayoutOverflow, format("invalid grid dimensions %sx%s", rows, cols));
	m_cells.resize((size_t)rows * cols);
}

Cell& Grid::at(int row, int col) {
	if(row < 0 || row >= m_rows || col < 0 || col >= m_cols)
		throw std::out_of_range(format("cell (%s, %s) is outside the grid", row, col));
	return m_cells[(size_t)row * m_cols + col];
}

Cell const& Grid::at(int row, int col) const {
	return const_cast<Grid*>(this)->at(row, col);
}

std::u32string Grid::rowText(int row) const {
	std::u32string r;
	for(int col = 0; col < m_cols; ++col)
		r += at(row, col).character;
	return r;
}

Page::Page(PageId id, Grid grid, int subpageCount, std::vector<Link> links, Fraction fetchedAt, std::string title)
	: id(id), grid(std::move(grid)), subpageCount(subpageCount), links(std::move(links)), fetchedAt(fetchedAt), title(std::move(title)) {
	enforce(subpageCount >= 1, "a page has at least one subpage");
}

Link const* Page::linkAt(int row, int col) const {
	for(auto& link : links)
		if(link.contains(row, col))
			return &link;
	return nullptr;
}

std::string Page::rowText(int row) const {
	return toUtf8(grid.rowText(row));
}

bool Page::operator==(Page const& other) const {
	return id == other.id && grid == other.grid && subpageCount == other.subpageCount
	    && links == other.links && fetchedAt == other.fetchedAt && title == other.title;
}

}
