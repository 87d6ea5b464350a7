#include "markup_decoder.hpp"
#include "error.hpp"
#include "lib_utils/format.hpp"
#include "lib_utils/json.hpp"
#include "lib_utils/log.hpp"
#include "lib_utils/utf8.hpp"
#include <cctype>
#include <map>

namespace Teletext {

namespace {

Error malformed(std::string const& msg) {
	return Error(ErrorKind::MalformedEncoding, msg);
}

bool isSpace(char32_t c) {
	return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

bool isAsciiAlpha(char32_t c) {
	return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool isAsciiDigit(char32_t c) {
	return c >= '0' && c <= '9';
}

std::string toLowerAscii(std::u32string const& s) {
	std::string r;
	for(auto c : s)
		r += (char)((c >= 'A' && c <= 'Z') ? c - 'A' + 'a' : c);
	return r;
}

struct NamedEntity {
	const char* name;
	char32_t value;
};

// &nbsp; lands on the grid as a plain space
NamedEntity const namedEntities[] = {
	{ "amp", U'&' },
	{ "lt", U'<' },
	{ "gt", U'>' },
	{ "quot", U'"' },
	{ "apos", U'\'' },
	{ "nbsp", U' ' },
	{ "auml", 0xE4 },
	{ "ouml", 0xF6 },
	{ "aring", 0xE5 },
	{ "Auml", 0xC4 },
	{ "Ouml", 0xD6 },
	{ "Aring", 0xC5 },
	{ "eacute", 0xE9 },
	{ "uuml", 0xFC },
	{ "deg", 0xB0 },
	{ "copy", 0xA9 },
	{ "middot", 0xB7 },
	{ "ndash", 0x2013 },
	{ "mdash", 0x2014 },
	{ "hellip", 0x2026 },
	{ "euro", 0x20AC },
};

struct Payload {
	std::string markup;
	std::string pagination; // navigation markup beside the page, may be empty
};

// "  {" means a JSON envelope, anything else is taken as markup
Payload unwrapEnvelope(std::string const& raw) {
	Payload payload;
	size_t i = 0;
	if(raw.compare(0, 3, "\xEF\xBB\xBF") == 0)
		i = 3;
	while(i < raw.size() && isspace((unsigned char)raw[i]))
		++i;
	if(i == raw.size() || raw[i] != '{') {
		payload.markup = raw.substr(i);
		return payload;
	}

	json::Value root;
	try {
		root = json::parse(raw.substr(i));
	} catch(std::runtime_error const& e) {
		throw malformed(format("invalid JSON envelope: %s", e.what()));
	}

	try {
		auto const& content = root["data"][0]["content"];
		payload.markup = std::string(content["text"]);
		if(content.has("pagination") && content["pagination"].type == json::Value::Type::String)
			payload.pagination = content["pagination"].stringValue;
	} catch(std::runtime_error const& e) {
		throw malformed(format("JSON envelope carries no page markup: %s", e.what()));
	}
	return payload;
}

// a <pre> element anywhere in the document
bool hasPreElement(std::u32string const& s) {
	for(auto i = s.find(U'<'); i != std::u32string::npos && i + 4 < s.size(); i = s.find(U'<', i + 1)) {
		if(toLowerAscii(s.substr(i + 1, 3)) != "pre")
			continue;
		auto const next = s[i + 4];
		if(next == '>' || next == '/' || isSpace(next))
			return true;
	}
	return false;
}

struct Tag {
	std::string name; // lower case
	bool closing = false;
	std::map<std::string, std::string> attributes; // lower case names, decoded values

	std::string attribute(const char* attrName) const {
		auto i = attributes.find(attrName);
		return i == attributes.end() ? std::string() : i->second;
	}
};

// Which part of a document lands on the grid.
enum class Region {
	Document,   // all text, minus the formatting line breaks between tags
	PreOnly,    // the bodies of <pre> elements
	Nothing,    // only the page references are kept
};

class MarkupDecoder {
	public:
		MarkupDecoder(std::u32string const& input, Region region) : m_in(input), m_region(region) {
		}

		DecodedStream run() {
			skipFormattingSpace();
			while(m_pos < m_in.size()) {
				auto const c = m_in[m_pos];
				if(c == '<') {
					onMarkup();
					skipFormattingSpace();
				} else if(c == '&') {
					++m_pos;
					appendText(readEntity());
				} else if(c == '\r') {
					++m_pos;
					if(m_pos < m_in.size() && m_in[m_pos] == '\n')
						++m_pos;
					lineBreak();
				} else if(c == '\n') {
					++m_pos;
					lineBreak();
				} else {
					++m_pos;
					appendText(c);
				}
			}

			if(m_inTitle)
				throw malformed("unterminated <title>");

			flushText();
			if(m_linkOpen)
				endLink();

			return std::move(m_out);
		}

	private:
		struct Frame {
			std::string tag;
			Color foreground;
			Color background;
			CellFlags flags;
		};

		std::u32string const& m_in;
		Region const m_region;
		size_t m_pos = 0;
		DecodedStream m_out;
		std::u32string m_text;
		bool m_inPre = false;

		Color m_foreground = Color::White;
		Color m_background = Color::Black;
		CellFlags m_flags = CellFlags::None;
		std::vector<Frame> m_frames;

		bool m_linkOpen = false;
		bool m_inTitle = false;
		std::u32string m_title;

		bool onGrid() const {
			switch(m_region) {
			case Region::Document: return true;
			case Region::PreOnly: return m_inPre;
			case Region::Nothing: return false;
			}
			return false;
		}

		// Outside <pre>, a whitespace run holding a line break between two tags
		// (or between a tag and either end of the document) only formats the markup.
		void skipFormattingSpace() {
			if(m_inPre || m_inTitle)
				return;
			auto end = m_pos;
			bool newline = false;
			while(end < m_in.size() && isSpace(m_in[end])) {
				newline = newline || m_in[end] == '\n' || m_in[end] == '\r';
				++end;
			}
			if(!newline)
				return;
			if(end == m_in.size() || startsMarkup(end))
				m_pos = end;
		}

		bool startsMarkup(size_t pos) const {
			if(m_in[pos] != '<' || pos + 1 >= m_in.size())
				return false;
			auto const next = m_in[pos + 1];
			return isAsciiAlpha(next) || next == '/' || next == '!' || next == '?';
		}

		void appendText(char32_t c) {
			if(m_inTitle) {
				m_title += c;
				return;
			}
			if(!onGrid())
				return;
			// other control characters have no cell representation
			if(c < 0x20 || c == 0x7F)
				c = U' ';
			m_text += c;
		}

		void flushText() {
			if(m_text.empty())
				return;
			Directive d;
			d.type = Directive::Text;
			d.text = std::move(m_text);
			m_out.push_back(std::move(d));
			m_text.clear();
		}

		void emit(Directive::Type type) {
			flushText();
			Directive d;
			d.type = type;
			m_out.push_back(std::move(d));
		}

		void lineBreak() {
			if(m_inTitle)
				m_title += U' ';
			else if(onGrid())
				emit(Directive::LineBreak);
		}

		// a line break right after <pre> belongs to the markup
		void skipLeadingLineBreak() {
			if(m_pos < m_in.size() && m_in[m_pos] == '\r')
				++m_pos;
			if(m_pos < m_in.size() && m_in[m_pos] == '\n')
				++m_pos;
		}

		void setForeground(Color color) {
			if(color == m_foreground)
				return;
			emit(Directive::SetForeground);
			m_out.back().color = color;
			m_foreground = color;
		}

		void setBackground(Color color) {
			if(color == m_background)
				return;
			emit(Directive::SetBackground);
			m_out.back().color = color;
			m_background = color;
		}

		void setFlags(CellFlags flags) {
			auto const added = flags & ~m_flags;
			auto const removed = m_flags & ~flags;
			if(added != CellFlags::None) {
				emit(Directive::SetFlags);
				m_out.back().flags = added;
			}
			if(removed != CellFlags::None) {
				emit(Directive::ClearFlags);
				m_out.back().flags = removed;
			}
			m_flags = flags;
		}

		void endLink() {
			emit(Directive::LinkEnd);
			m_linkOpen = false;
		}

		char32_t readEntity() {
			if(m_pos >= m_in.size() || (m_in[m_pos] != '#' && !isAsciiAlpha(m_in[m_pos])))
				return U'&';

			auto const start = m_pos;
			std::u32string name;
			while(m_pos < m_in.size() && m_in[m_pos] != ';') {
				auto const c = m_in[m_pos];
				if(!isAsciiAlpha(c) && !isAsciiDigit(c) && !(c == '#' && m_pos == start))
					break;
				name += c;
				++m_pos;
			}

			if(m_pos >= m_in.size() || m_in[m_pos] != ';')
				throw malformed(format("unterminated entity '&%s'", toUtf8(name)));
			++m_pos;

			if(name[0] == '#')
				return numericEntity(name);

			for(auto& entity : namedEntities) {
				if(toUtf8(name) == entity.name)
					return entity.value;
			}
			throw malformed(format("unknown entity '&%s;'", toUtf8(name)));
		}

		static char32_t numericEntity(std::u32string const& name) {
			bool hex = name.size() > 1 && (name[1] == 'x' || name[1] == 'X');
			size_t i = hex ? 2 : 1;
			if(i >= name.size() || name.size() - i > 8)
				throw malformed(format("invalid character reference '&%s;'", toUtf8(name)));

			uint32_t value = 0;
			for(; i < name.size(); ++i) {
				auto const c = name[i];
				int digit;
				if(isAsciiDigit(c))
					digit = c - '0';
				else if(hex && c >= 'a' && c <= 'f')
					digit = c - 'a' + 10;
				else if(hex && c >= 'A' && c <= 'F')
					digit = c - 'A' + 10;
				else
					throw malformed(format("invalid character reference '&%s;'", toUtf8(name)));
				value = value * (hex ? 16 : 10) + digit;
			}

			if(value == 0 || value > 0x10FFFF || (value >= 0xD800 && value <= 0xDFFF))
				throw malformed(format("character reference '&%s;' is not a valid code point", toUtf8(name)));
			return (char32_t)value;
		}

		// skips up to and including 'terminator', throws if absent
		void skipPast(std::u32string const& terminator, const char* what) {
			auto end = m_in.find(terminator, m_pos);
			if(end == std::u32string::npos)
				throw malformed(format("unterminated %s", what));
			m_pos = end + terminator.size();
		}

		void skipSpaces() {
			while(m_pos < m_in.size() && isSpace(m_in[m_pos]))
				++m_pos;
		}

		void expectMore(const char* what) {
			if(m_pos >= m_in.size())
				throw malformed(format("unterminated %s", what));
		}

		std::u32string readName() {
			std::u32string name;
			while(m_pos < m_in.size()) {
				auto const c = m_in[m_pos];
				if(isSpace(c) || c == '>' || c == '/' || c == '=')
					break;
				name += c;
				++m_pos;
			}
			return name;
		}

		std::string readAttributeValue() {
			std::u32string value;
			expectMore("tag");
			auto const quote = m_in[m_pos];
			if(quote == '"' || quote == '\'') {
				++m_pos;
				while(true) {
					expectMore("attribute value");
					auto const c = m_in[m_pos];
					if(c == quote) {
						++m_pos;
						break;
					}
					++m_pos;
					value += c == '&' ? readEntity() : c;
				}
			} else {
				while(m_pos < m_in.size() && !isSpace(m_in[m_pos]) && m_in[m_pos] != '>') {
					auto const c = m_in[m_pos++];
					value += c == '&' ? readEntity() : c;
				}
			}
			return toUtf8(value);
		}

		Tag readTag() {
			Tag tag;
			++m_pos; // '<'
			expectMore("tag");
			if(m_in[m_pos] == '/') {
				tag.closing = true;
				++m_pos;
			}
			tag.name = toLowerAscii(readName());

			while(true) {
				skipSpaces();
				expectMore("tag");
				auto const c = m_in[m_pos];
				if(c == '>') {
					++m_pos;
					return tag;
				}
				if(c == '/') {
					++m_pos;
					continue;
				}

				auto const attrName = toLowerAscii(readName());
				if(attrName.empty())
					throw malformed("invalid character in tag");
				skipSpaces();
				std::string value;
				if(m_pos < m_in.size() && m_in[m_pos] == '=') {
					++m_pos;
					skipSpaces();
					value = readAttributeValue();
				}
				tag.attributes[attrName] = value;
			}
		}

		void onMarkup() {
			static std::u32string const commentStart = U"<!--";
			if(m_in.compare(m_pos, commentStart.size(), commentStart) == 0) {
				m_pos += commentStart.size();
				skipPast(U"-->", "comment");
				return;
			}
			if(m_pos + 1 < m_in.size() && (m_in[m_pos + 1] == '!' || m_in[m_pos + 1] == '?')) {
				skipPast(U">", "declaration");
				return;
			}
			// a '<' that can't start a tag is text
			if(m_pos + 1 < m_in.size() && !isAsciiAlpha(m_in[m_pos + 1]) && m_in[m_pos + 1] != '/') {
				++m_pos;
				appendText(U'<');
				return;
			}

			auto const tag = readTag();
			if(m_inTitle && !(tag.closing && tag.name == "title"))
				return;

			if(tag.closing)
				onClose(tag);
			else
				onOpen(tag);
		}

		void pushFrame(std::string const& name) {
			m_frames.push_back({ name, m_foreground, m_background, m_flags });
		}

		void onOpen(Tag const& tag) {
			auto const& name = tag.name;
			if(name == "br") {
				lineBreak();
			} else if(name == "pre") {
				flushText();
				m_inPre = true;
				skipLeadingLineBreak();
			} else if(name == "title") {
				flushText();
				m_inTitle = true;
				m_title.clear();
			} else if(name == "script" || name == "style") {
				auto const closing = U"</" + fromUtf8(name);
				skipPast(closing, name.c_str());
				skipPast(U">", name.c_str());
			} else if(name == "font") {
				pushFrame(name);
				Color color;
				auto const value = tag.attribute("color");
				if(parseColor(value, color))
					setForeground(color);
				else if(!value.empty())
					logMsg(Debug, "MarkupDecoder", "ignoring unknown color '%s'", value);
			} else if(name == "span") {
				pushFrame(name);
				onSpanClasses(tag.attribute("class"));
			} else if(name == "b" || name == "strong") {
				pushFrame(name);
				setFlags(m_flags | CellFlags::Bold);
			} else if(name == "blink") {
				pushFrame(name);
				setFlags(m_flags | CellFlags::Blink);
			} else if(name == "big") {
				pushFrame(name);
				setFlags(m_flags | CellFlags::DoubleHeight);
			} else if(name == "a") {
				onAnchor(tag);
			} else if(name == "meta") {
				onMeta(tag);
			}
		}

		void onSpanClasses(std::string const& classes) {
			size_t i = 0;
			while(i < classes.size()) {
				auto end = classes.find(' ', i);
				if(end == std::string::npos)
					end = classes.size();
				auto const cls = classes.substr(i, end - i);
				i = end + 1;

				Color color;
				if(cls.compare(0, 3, "fg-") == 0 && parseColor(cls.substr(3), color))
					setForeground(color);
				else if(cls.compare(0, 3, "bg-") == 0 && parseColor(cls.substr(3), color))
					setBackground(color);
				else if(cls == "bold")
					setFlags(m_flags | CellFlags::Bold);
				else if(cls == "blink")
					setFlags(m_flags | CellFlags::Blink);
				else if(cls == "dh" || cls == "double-height")
					setFlags(m_flags | CellFlags::DoubleHeight);
			}
		}

		void onAnchor(Tag const& tag) {
			// anchors don't nest
			if(m_linkOpen)
				endLink();

			PageId target;
			auto const href = tag.attribute("href");
			if(!parseLinkTarget(href, target) && !parseLinkTarget(tag.attribute("data-yle-ttv-page-name"), target)) {
				logMsg(Debug, "MarkupDecoder", "anchor '%s' doesn't designate a page, kept as plain text", href);
				return;
			}

			// navigation outside the laid-out text
			if(!onGrid()) {
				emit(Directive::PageRef);
				m_out.back().target = target;
				return;
			}

			emit(Directive::LinkBegin);
			m_out.back().target = target;
			m_linkOpen = true;
		}

		void onMeta(Tag const& tag) {
			if(toLowerAscii(fromUtf8(tag.attribute("name"))) != "subpages")
				return;
			auto const content = tag.attribute("content");
			int count = 0;
			for(auto c : content) {
				if(!isdigit((unsigned char)c) || count > MaxSubpage)
					throw malformed(format("invalid subpage count '%s'", content));
				count = count * 10 + (c - '0');
			}
			if(count < 1 || count > MaxSubpage)
				throw malformed(format("invalid subpage count '%s'", content));
			emit(Directive::SubpageCount);
			m_out.back().count = count;
		}

		void onClose(Tag const& tag) {
			auto const& name = tag.name;
			if(name == "title") {
				if(!m_inTitle)
					return;
				m_inTitle = false;
				emit(Directive::Title);
				m_out.back().text = trim(m_title);
			} else if(name == "a") {
				if(m_linkOpen)
					endLink();
			} else if(name == "pre") {
				if(m_linkOpen)
					endLink();
				flushText();
				m_inPre = false;
			} else {
				closeFrame(name);
			}
		}

		// restores the attributes in effect before the matching opening tag
		void closeFrame(std::string const& name) {
			for(auto i = m_frames.size(); i > 0; --i) {
				if(m_frames[i - 1].tag != name)
					continue;
				auto const frame = m_frames[i - 1];
				m_frames.resize(i - 1);
				setForeground(frame.foreground);
				setBackground(frame.background);
				setFlags(frame.flags);
				return;
			}
			// stray closing tags are ignored
		}

		static std::u32string trim(std::u32string const& s) {
			size_t first = 0, last = s.size();
			while(first < last && isSpace(s[first]))
				++first;
			while(last > first && isSpace(s[last - 1]))
				--last;
			return s.substr(first, last - first);
		}
};

// parses exactly 'n' digits at s[pos..]
bool readDigits(std::string const& s, size_t pos, size_t n, int& value) {
	if(pos + n > s.size())
		return false;
	value = 0;
	for(size_t i = pos; i < pos + n; ++i) {
		if(!isdigit((unsigned char)s[i]))
			return false;
		value = value * 10 + (s[i] - '0');
	}
	return pos + n == s.size() || !isdigit((unsigned char)s[pos + n]);
}

// "200", "200_0002", "200#2" or "200/2" at s[pos..], followed by anything but a digit
bool readPageRef(std::string const& s, size_t pos, PageId& target) {
	int number;
	if(!readDigits(s, pos, 3, number) || !isValidPageNumber(number))
		return false;

	int subpage = 1;
	pos += 3;
	if(pos + 1 < s.size() && (s[pos] == '_' || s[pos] == '#' || s[pos] == '/') && isdigit((unsigned char)s[pos + 1])) {
		++pos;
		subpage = 0;
		size_t digits = 0;
		while(pos < s.size() && isdigit((unsigned char)s[pos])) {
			if(++digits > 4)
				return false;
			subpage = subpage * 10 + (s[pos++] - '0');
		}
		if(subpage < 1)
			return false;
	}
	target = PageId(number, subpage);
	return true;
}

}

bool parseLinkTarget(std::string const& href, PageId& target) {
	// query form: "...?P=200_0002"
	for(auto key : { "P=", "p=" }) {
		auto i = href.find(key);
		if(i != std::string::npos && (i == 0 || !isalnum((unsigned char)href[i - 1])))
			return readPageRef(href, i + 2, target);
	}

	// path form: ".../200.htm", ".../200_0002.html", "200"
	auto const slash = href.find_last_of('/');
	auto const last = slash == std::string::npos ? 0 : slash + 1;
	if(last >= href.size())
		return false;
	PageId candidate;
	if(!readPageRef(href, last, candidate))
		return false;
	target = candidate;
	return true;
}

namespace {

std::u32string decodeUtf8(std::string const& s) {
	try {
		return fromUtf8(s);
	} catch(std::runtime_error const& e) {
		throw malformed(format("invalid UTF-8: %s", e.what()));
	}
}

}

DecodedStream decode(std::string const& raw) {
	auto const payload = unwrapEnvelope(raw);

	auto const text = decodeUtf8(payload.markup);
	MarkupDecoder decoder(text, hasPreElement(text) ? Region::PreOnly : Region::Document);
	auto stream = decoder.run();

	if(!payload.pagination.empty()) {
		// the page stays usable without its navigation bar
		try {
			auto const pagination = decodeUtf8(payload.pagination);
			for(auto& d : MarkupDecoder(pagination, Region::Nothing).run()) {
				if(d.type == Directive::PageRef)
					stream.push_back(d);
			}
		} catch(Error const& e) {
			logMsg(Warning, "MarkupDecoder", "ignoring the pagination: %s", e.what());
		}
	}

	return stream;
}

}
