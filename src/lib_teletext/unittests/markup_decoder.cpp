#include "tests/tests.hpp"
#include "lib_teletext/error.hpp"
#include "lib_teletext/markup_decoder.hpp"
#include "lib_utils/utf8.hpp"

using namespace Tests;
using namespace Teletext;

namespace {

// compact trace of a stream, e.g. "T(abc) BR FG(red)"
std::string trace(DecodedStream const& stream) {
	std::string r;
	for(auto& d : stream) {
		if(!r.empty())
			r += " ";
		switch(d.type) {
		case Directive::Text: r += "T(" + toUtf8(d.text) + ")"; break;
		case Directive::LineBreak: r += "BR"; break;
		case Directive::SetForeground: r += std::string("FG(") + toString(d.color) + ")"; break;
		case Directive::SetBackground: r += std::string("BG(") + toString(d.color) + ")"; break;
		case Directive::SetFlags: r += "SET(" + std::to_string((int)d.flags) + ")"; break;
		case Directive::ClearFlags: r += "CLR(" + std::to_string((int)d.flags) + ")"; break;
		case Directive::LinkBegin: r += "A(" + toString(d.target) + ")"; break;
		case Directive::LinkEnd: r += "/A"; break;
		case Directive::SubpageCount: r += "SUB(" + std::to_string(d.count) + ")"; break;
		case Directive::Title: r += "TITLE(" + toUtf8(d.text) + ")"; break;
		case Directive::PageRef: r += "REF(" + toString(d.target) + ")"; break;
		}
	}
	return r;
}

bool isMalformed(std::string const& raw) {
	try {
		decode(raw);
		return false;
	} catch(Error const& e) {
		return e.kind() == ErrorKind::MalformedEncoding;
	}
}

unittest("MarkupDecoder: plain text and line breaks") {
	ASSERT_EQUALS("T(abc) BR T(def) BR BR T(g)", trace(decode("abc\ndef\r\n<br>g")));
	ASSERT_EQUALS("", trace(decode("")));
}

unittest("MarkupDecoder: only the <pre> body is laid out") {
	auto const raw =
	    "<html>\n<head>\n<title>P100</title>\n</head>\n<body>\n"
	    "<p>intro</p>\n<pre>\nline1\r\n  <b>line2</b>\r\n</pre>\n<p>footer</p>\n</body>\n</html>\n";
	ASSERT_EQUALS("TITLE(P100) T(line1) BR T(  ) SET(1) T(line2) CLR(1) BR", trace(decode(raw)));
}

unittest("MarkupDecoder: line breaks formatting the markup are dropped") {
	auto const raw = "<html>\n  <body>\n<b>A</b>\n  <b>B</b> <i>C</i>\n</body>\n</html>\n";
	ASSERT_EQUALS("SET(1) T(A) CLR(1) SET(1) T(B) CLR(1) T( C)", trace(decode(raw)));
	// line breaks within the text stay
	ASSERT_EQUALS("T(a) BR T(b)", trace(decode("<body>a\nb</body>")));
}

unittest("MarkupDecoder: anchors outside <pre> are page references") {
	auto const s = decode("<p><a href=\"?P=200_0003\">3</a> <a href=\"/\">home</a></p><pre>x</pre>");
	ASSERT_EQUALS("REF(200/3) T(x)", trace(s));
}

unittest("MarkupDecoder: entities") {
	ASSERT_EQUALS("T(a&b<c>\"d' e)", trace(decode("a&amp;b&lt;c&gt;&quot;d&#39;&nbsp;e")));
	ASSERT_EQUALS("T(\xc3\xa4\xe2\x82\xac)", trace(decode("&auml;&#x20AC;")));
	ASSERT_EQUALS("T(A)", trace(decode("&#65;")));
	ASSERT_EQUALS("T(1 & 2)", trace(decode("1 & 2")));
}

unittest("MarkupDecoder: broken entities are rejected") {
	ASSERT(isMalformed("a &amp b"));
	ASSERT(isMalformed("truncated &am"));
	ASSERT(isMalformed("&bogus;"));
	ASSERT(isMalformed("&#;"));
	ASSERT(isMalformed("&#xZZ;"));
	ASSERT(isMalformed("&#xD800;"));
	ASSERT(isMalformed("&#1114112;"));
}

unittest("MarkupDecoder: invalid UTF-8 and unterminated markup are rejected") {
	ASSERT(isMalformed("abc\xc3"));
	ASSERT(isMalformed("abc\xff"));
	ASSERT(isMalformed("<font color=\"red\""));
	ASSERT(isMalformed("<a href='?P=200>x"));
	ASSERT(isMalformed("<!-- comment"));
	ASSERT(isMalformed("<title>no end"));
}

unittest("MarkupDecoder: colors are restored by closing tags") {
	auto const s = decode("a<font color=\"red\">b<font color=\"#00ff00\">c</font>d</font>e");
	ASSERT_EQUALS("T(a) FG(red) T(b) FG(green) T(c) FG(red) T(d) FG(white) T(e)", trace(s));
}

unittest("MarkupDecoder: span classes") {
	auto const s = decode("<span class=\"fg-yellow bg-blue\">x</span>y");
	ASSERT_EQUALS("FG(yellow) BG(blue) T(x) FG(white) BG(black) T(y)", trace(s));
}

unittest("MarkupDecoder: flags") {
	auto const s = decode("<b>bold<blink>both</blink></b><big>tall</big>");
	ASSERT_EQUALS("SET(1) T(bold) SET(2) T(both) CLR(2) CLR(1) SET(4) T(tall) CLR(4)", trace(s));
}

unittest("MarkupDecoder: stray closing tags and unknown tags are ignored") {
	ASSERT_EQUALS("T(ab)", trace(decode("</font>a<div class='x'>b</div>")));
	ASSERT_EQUALS("T(a < b)", trace(decode("a < b")));
	ASSERT_EQUALS("T(ab)", trace(decode("a<script>var x = '<b>';</script>b")));
}

unittest("MarkupDecoder: anchors") {
	auto const s = decode("see <a href=\"?P=200_0002\">news</a> or <a href='/ttv/300.htm'>sport</a>");
	ASSERT_EQUALS("T(see ) A(200/2) T(news) /A T( or ) A(300/1) T(sport) /A", trace(s));
}

unittest("MarkupDecoder: anchors without a page are plain text") {
	ASSERT_EQUALS("T(home)", trace(decode("<a href=\"https://example.com/\">home</a>")));
	ASSERT_EQUALS("T(x)", trace(decode("<a href=\"?P=050\">x</a>")));
}

unittest("MarkupDecoder: subpage count and title") {
	auto const s = decode("<title> Uutiset\n100 </title><meta name=\"subpages\" content=\"3\">x");
	ASSERT_EQUALS("TITLE(Uutiset 100) SUB(3) T(x)", trace(s));
	ASSERT(isMalformed("<meta name=\"subpages\" content=\"three\">"));
	ASSERT(isMalformed("<meta name=\"subpages\" content=\"0\">"));
}

unittest("MarkupDecoder: JSON envelope") {
	auto const raw = R"({ "data": [ { "content": { "text": "a&amp;b\nc" } } ] })";
	ASSERT_EQUALS("T(a&b) BR T(c)", trace(decode(raw)));
	ASSERT(isMalformed("{ \"data\": [] }"));
	ASSERT(isMalformed("{ \"data\": "));
	ASSERT(isMalformed("{ \"data\": [ { \"content\": { \"text\": 3 } } ] }"));
}

unittest("MarkupDecoder: JSON envelope pagination") {
	auto const raw = R"({ "data": [ { "content": {
		"text": "<pre>uutiset</pre>",
		"pagination": "<span></span><a href=\"?P=100_0002\">2/4</a> <a data-yle-ttv-page-name=\"100_0004\"><span>4</span>/4</a><a href=\"?P=101\">101</a>"
	} } ] })";
	ASSERT_EQUALS("T(uutiset) REF(100/2) REF(100/4) REF(101/1)", trace(decode(raw)));

	// broken navigation doesn't make the page unusable
	auto const broken = R"({ "data": [ { "content": { "text": "<pre>uutiset</pre>", "pagination": "&bogus;" } } ] })";
	ASSERT_EQUALS("T(uutiset)", trace(decode(broken)));
}

unittest("MarkupDecoder: link targets") {
	PageId id;
	ASSERT(parseLinkTarget("?P=123", id));
	ASSERT_EQUALS(PageId(123), id);
	ASSERT(parseLinkTarget("https://x/json?P=201_0003", id));
	ASSERT_EQUALS(PageId(201, 3), id);
	ASSERT(parseLinkTarget("?p=202#2", id));
	ASSERT_EQUALS(PageId(202, 2), id);
	ASSERT(parseLinkTarget("/tekstitv/400.htm", id));
	ASSERT_EQUALS(PageId(400), id);
	ASSERT(parseLinkTarget("500", id));
	ASSERT_EQUALS(PageId(500), id);

	ASSERT(!parseLinkTarget("", id));
	ASSERT(parseLinkTarget("?P=200_9999", id));
	ASSERT_EQUALS(PageId(200, 9999), id);
	ASSERT(!parseLinkTarget("?P=1234", id));
	ASSERT(!parseLinkTarget("?P=200_12345", id));
	ASSERT(!parseLinkTarget("/ttv/200_00002.htm", id));
	ASSERT(!parseLinkTarget("?P=099", id));
	ASSERT(!parseLinkTarget("/about/", id));
	ASSERT(!parseLinkTarget("index.html", id));
}

unittest("MarkupDecoder: colors") {
	Color c;
	ASSERT(parseColor("Cyan", c) && c == Color::Cyan);
	ASSERT(parseColor("#ff0", c) && c == Color::Yellow);
	ASSERT(parseColor("#7f7f7f", c) && c == Color::Black);
	ASSERT(parseColor("#80ff80", c) && c == Color::White);
	ASSERT(!parseColor("#12", c));
	ASSERT(!parseColor("orange", c));
}

}
