#include "tests/tests.hpp"
#include "fakes.hpp"
#include "lib_teletext/error.hpp"
#include "lib_teletext/markup_decoder.hpp"
#include "lib_teletext/page_parser.hpp"

using namespace Tests;
using namespace Teletext;

namespace {

PagePtr parseMarkup(std::string const& markup, int rows = 24, int cols = 40) {
	auto clock = std::make_shared<FakeClock>();
	PageParser parser(rows, cols, clock);
	return parser.parse(decode(markup), PageId(100));
}

ErrorKind parseError(std::string const& markup, int rows, int cols) {
	try {
		parseMarkup(markup, rows, cols);
	} catch(Error const& e) {
		return e.kind();
	}
	throw std::runtime_error("no error was raised");
}

unittest("PageParser: grid always has the configured dimensions") {
	auto const page = parseMarkup("hello");
	ASSERT_EQUALS(24, page->grid.rows());
	ASSERT_EQUALS(40, page->grid.cols());
	ASSERT_EQUALS("hello" + std::string(35, ' '), page->rowText(0));
	ASSERT_EQUALS(std::string(40, ' '), page->rowText(23));
	ASSERT_EQUALS(1, page->subpageCount);
	ASSERT_EQUALS(PageId(100), page->id);
}

unittest("PageParser: column overflow wraps to the next row") {
	auto const page = parseMarkup("abcdefg", 2, 4);
	ASSERT_EQUALS("abcd", page->rowText(0));
	ASSERT_EQUALS("efg ", page->rowText(1));
}

unittest("PageParser: a full row followed by a line break doesn't skip a row") {
	auto const page = parseMarkup("abc\ndef\n", 2, 3);
	ASSERT_EQUALS("abc", page->rowText(0));
	ASSERT_EQUALS("def", page->rowText(1));
}

unittest("PageParser: too much content is rejected") {
	ASSERT(parseError("abc\ndef\ng", 2, 3) == ErrorKind::LayoutOverflow);
	ASSERT(parseError("abcdefg", 2, 3) == ErrorKind::LayoutOverflow);
	ASSERT(parseError("a\n\n\nb", 3, 3) == ErrorKind::LayoutOverflow);
}

unittest("PageParser: a stream without text is not a page") {
	ASSERT(parseError("", 24, 40) == ErrorKind::NoContent);
	ASSERT(parseError("<title>only a title</title><br><br>", 24, 40) == ErrorKind::NoContent);

	// blank but present text is a legal page
	auto const page = parseMarkup("   ");
	ASSERT_EQUALS(std::string(40, ' '), page->rowText(0));
}

unittest("PageParser: attributes apply to the following cells only") {
	auto const page = parseMarkup("a<font color=\"red\"><b>b</b></font><span class=\"bg-blue\">c</span>");
	auto const& g = page->grid;
	ASSERT(g.at(0, 0).foreground == Color::White);
	ASSERT(g.at(0, 0).flags == CellFlags::None);
	ASSERT(g.at(0, 1).foreground == Color::Red);
	ASSERT(hasFlag(g.at(0, 1).flags, CellFlags::Bold));
	ASSERT(g.at(0, 2).foreground == Color::White);
	ASSERT(g.at(0, 2).background == Color::Blue);
	ASSERT(g.at(0, 3).background == Color::Black);
}

unittest("PageParser: implicit links") {
	auto const page = parseMarkup("Uutiset 102\nklo 12.300 1999\n  Urheilu 201");
	ASSERT_EQUALS(2u, page->links.size());

	auto const& first = page->links[0];
	ASSERT_EQUALS(PageId(102), first.target);
	ASSERT_EQUALS(0, first.row);
	ASSERT_EQUALS(8, first.colStart);
	ASSERT_EQUALS(11, first.colEnd);
	ASSERT(!first.explicitAnchor);

	ASSERT_EQUALS(PageId(201), page->links[1].target);
	ASSERT_EQUALS(2, page->links[1].row);
	ASSERT_EQUALS(10, page->links[1].colStart);
}

unittest("PageParser: explicit anchors override detected numbers") {
	auto const page = parseMarkup("<a href=\"?P=300_0002\">see 200</a> 400");
	ASSERT_EQUALS(2u, page->links.size());
	ASSERT_EQUALS(PageId(300, 2), page->links[0].target);
	ASSERT(page->links[0].explicitAnchor);
	ASSERT_EQUALS(0, page->links[0].colStart);
	ASSERT_EQUALS(7, page->links[0].colEnd);
	ASSERT_EQUALS(PageId(400), page->links[1].target);
}

unittest("PageParser: an anchor wrapping over two rows gives one link per row") {
	auto const page = parseMarkup("ab<a href=\"?P=300\">cdefgh</a>", 3, 5);
	ASSERT_EQUALS(2u, page->links.size());
	ASSERT_EQUALS(0, page->links[0].row);
	ASSERT_EQUALS(2, page->links[0].colStart);
	ASSERT_EQUALS(5, page->links[0].colEnd);
	ASSERT_EQUALS(1, page->links[1].row);
	ASSERT_EQUALS(0, page->links[1].colStart);
	ASSERT_EQUALS(3, page->links[1].colEnd);
	ASSERT_EQUALS(PageId(300), page->links[1].target);
}

unittest("PageParser: link lookup by cell") {
	auto const page = parseMarkup("go 200 now");
	ASSERT(page->linkAt(0, 2) == nullptr);
	ASSERT(page->linkAt(0, 3) != nullptr);
	ASSERT_EQUALS(PageId(200), page->linkAt(0, 5)->target);
	ASSERT(page->linkAt(0, 6) == nullptr);
	ASSERT(page->linkAt(1, 3) == nullptr);
}

unittest("PageParser: subpage count, title and fetch time") {
	auto clock = std::make_shared<FakeClock>();
	PageParser parser(24, 40, clock);
	auto const page = parser.parse(decode("<title>YLE 100</title><meta name=\"subpages\" content=\"4\">x"), PageId(100, 3));
	ASSERT_EQUALS(4, page->subpageCount);
	ASSERT_EQUALS("YLE 100", page->title);
	ASSERT(page->fetchedAt == clock->now());
	ASSERT_EQUALS(PageId(100, 3), page->id);
}

unittest("PageParser: an indented HTML document fills the grid from its <pre> body") {
	auto const raw =
	    "<html>\n<head>\n<title>P100</title>\n</head>\n<body>\n"
	    "<pre>line1\r\nline2\r\nline3\r\n</pre>\n</body>\n</html>\n";
	auto const page = parseMarkup(raw, 3, 10);
	ASSERT_EQUALS("line1     ", page->rowText(0));
	ASSERT_EQUALS("line2     ", page->rowText(1));
	ASSERT_EQUALS("line3     ", page->rowText(2));
	ASSERT_EQUALS("P100", page->title);
}

unittest("PageParser: subpage count from the pagination of the envelope") {
	auto const raw = R"({ "data": [ { "content": {
		"text": "<pre>uutiset</pre>",
		"pagination": "<a href=\"?P=100_0002\">2</a><a href=\"?P=100_0004\">4</a><a href=\"?P=101_0007\">101</a>"
	} } ] })";
	auto clock = std::make_shared<FakeClock>();
	PageParser parser(24, 40, clock);
	ASSERT_EQUALS(4, parser.parse(decode(raw), PageId(100))->subpageCount);
	// links to other pages don't count
	ASSERT_EQUALS(1, parser.parse(decode(raw), PageId(102))->subpageCount);
	// the displayed subpage exists even when no link points to it
	ASSERT_EQUALS(6, parser.parse(decode(raw), PageId(100, 6))->subpageCount);
}

unittest("PageParser: subpage count from the subpage row below the text") {
	auto const raw = "<pre>sivu</pre><p><a href=\"?P=300_0001\">1</a> 2 <a href=\"?P=300_0003\">3</a></p>";
	auto clock = std::make_shared<FakeClock>();
	PageParser parser(24, 40, clock);
	auto const page = parser.parse(decode(raw), PageId(300, 2));
	ASSERT_EQUALS(3, page->subpageCount);
	ASSERT_EQUALS("sivu", page->rowText(0).substr(0, 4));
	ASSERT(page->links.empty());
}

unittest("PageParser: invalid dimensions") {
	ASSERT_THROWN(PageParser(0, 40));
	ASSERT_THROWN(PageParser(24, -1));
}

}
