#pragma once

#include "page.hpp"
#include <string>
#include <vector>

namespace Teletext {

// One item of a decoded page: either a run of text or a layout directive.
struct Directive {
	enum Type {
		Text,           // 'text'
		LineBreak,
		SetForeground,  // 'color'
		SetBackground,  // 'color'
		SetFlags,       // 'flags' are added
		ClearFlags,     // 'flags' are removed
		LinkBegin,      // 'target'
		LinkEnd,
		SubpageCount,   // 'count'
		Title,          // 'text'
		PageRef,        // 'target', a page referenced outside the laid-out text
	};

	Type type = Text;
	std::u32string text;
	Color color = Color::White;
	CellFlags flags = CellFlags::None;
	PageId target;
	int count = 0;
};

typedef std::vector<Directive> DecodedStream;

// Decodes a raw page payload into an ordered directive stream.
// The payload is either HTML-like teletext markup, or a JSON envelope
// carrying that markup in data[0].content.text and its navigation bar in
// data[0].content.pagination.
// When the markup holds a <pre> element, only the <pre> bodies are laid out.
// Throws Error(MalformedEncoding).
DecodedStream decode(std::string const& raw);

// Extracts the page a link points to ("?P=200_0002", "/ttv/200.htm", ...).
// Returns false when 'href' doesn't designate a valid page.
bool parseLinkTarget(std::string const& href, PageId& target);

}
