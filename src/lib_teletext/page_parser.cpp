#include "page_parser.hpp"
#include "error.hpp"
#include "link_detector.hpp"
#include "lib_utils/format.hpp"
#include "lib_utils/log.hpp"
#include "lib_utils/utf8.hpp"
#include <algorithm>

namespace Teletext {

namespace {

// Cursor and attribute state while laying out one page.
// The column may reach 'cols': wrapping is deferred to the next character, so
// that a full row followed by a line break doesn't leave an empty row.
struct Layout {
	Layout(int rows, int cols) : grid(rows, cols) {
	}

	Grid grid;
	int row = 0, col = 0;
	Cell pen;

	bool linkOpen = false;
	PageId linkTarget;
	int segmentRow = -1, segmentStart = 0, segmentEnd = 0;
	std::vector<Link> links;

	void put(char32_t c) {
		if(col >= grid.cols()) {
			++row;
			col = 0;
		}
		if(row >= grid.rows())
			throw Error(ErrorKind::LayoutOverflow, format("text doesn't fit in %s rows of %s columns", grid.rows(), grid.cols()));

		auto& cell = grid.at(row, col);
		cell = pen;
		cell.character = c;

		if(linkOpen) {
			if(segmentRow != row) {
				closeSegment();
				segmentRow = row;
				segmentStart = col;
			}
			segmentEnd = col + 1;
		}
		++col;
	}

	void lineBreak() {
		++row;
		col = 0;
	}

	void beginLink(PageId target) {
		if(linkOpen)
			endLink();
		linkOpen = true;
		linkTarget = target;
		segmentRow = -1;
	}

	void endLink() {
		if(!linkOpen)
			return;
		closeSegment();
		linkOpen = false;
	}

	// one link per row an anchor spans, anchors without text produce none
	void closeSegment() {
		if(segmentRow < 0)
			return;
		Link link;
		link.target = linkTarget;
		link.row = segmentRow;
		link.colStart = segmentStart;
		link.colEnd = segmentEnd;
		link.explicitAnchor = true;
		links.push_back(link);
		segmentRow = -1;
	}
};

bool overlapsExplicit(std::vector<Link> const& links, int row, int colStart, int colEnd) {
	for(auto& link : links) {
		if(link.row == row && colStart < link.colEnd && link.colStart < colEnd)
			return true;
	}
	return false;
}

}

PageParser::PageParser(int rows, int cols, std::shared_ptr<IClock> clock)
	: m_rows(rows), m_cols(cols), m_clock(clock) {
	if(rows <= 0 || cols <= 0)
		throw std::runtime_error(format("invalid page dimensions %sx%s", rows, cols));
	enforce(clock != nullptr, "PageParser needs a clock");
}

PagePtr PageParser::parse(DecodedStream const& stream, PageId id) const {
	Layout layout(m_rows, m_cols);
	int declaredSubpages = 0;
	int highestSubpage = id.subpage();
	std::string title;
	bool hasText = false;

	for(auto& d : stream) {
		switch(d.type) {
		case Directive::Text:
			for(auto c : d.text)
				layout.put(c);
			hasText = hasText || !d.text.empty();
			break;
		case Directive::LineBreak:
			layout.lineBreak();
			break;
		case Directive::SetForeground:
			layout.pen.foreground = d.color;
			break;
		case Directive::SetBackground:
			layout.pen.background = d.color;
			break;
		case Directive::SetFlags:
			layout.pen.flags = layout.pen.flags | d.flags;
			break;
		case Directive::ClearFlags:
			layout.pen.flags = layout.pen.flags & ~d.flags;
			break;
		case Directive::LinkBegin:
			layout.beginLink(d.target);
			if(d.target.number() == id.number())
				highestSubpage = std::max(highestSubpage, d.target.subpage());
			break;
		case Directive::PageRef:
			if(d.target.number() == id.number())
				highestSubpage = std::max(highestSubpage, d.target.subpage());
			break;
		case Directive::LinkEnd:
			layout.endLink();
			break;
		case Directive::SubpageCount:
			declaredSubpages = std::max(1, d.count);
			break;
		case Directive::Title:
			title = toUtf8(d.text);
			break;
		}
	}
	layout.endLink();

	if(!hasText)
		throw Error(ErrorKind::NoContent, format("page %s has no text", toString(id)));

	// a declared count wins over the subpages the page links to
	auto const subpageCount = declaredSubpages > 0 ? declaredSubpages : highestSubpage;

	auto links = std::move(layout.links);
	auto const explicitCount = links.size();
	for(int row = 0; row < m_rows; ++row) {
		for(auto& match : findPageNumbers(layout.grid.rowText(row))) {
			auto const colEnd = match.start + match.length;
			if(overlapsExplicit(links, row, match.start, colEnd))
				continue;
			Link link;
			link.target = PageId(match.number, 1);
			link.row = row;
			link.colStart = match.start;
			link.colEnd = colEnd;
			links.push_back(link);
		}
	}

	std::sort(links.begin(), links.end(), [](Link const& a, Link const& b) {
		if(a.row != b.row)
			return a.row < b.row;
		return a.colStart < b.colStart;
	});

	logMsg(Debug, "PageParser", "page %s: %s subpage(s), %s link(s), %s from anchors", toString(id), subpageCount, links.size(), explicitCount);

	return std::make_shared<const Page>(id, std::move(layout.grid), subpageCount, std::move(links), m_clock->now(), title);
}

}
