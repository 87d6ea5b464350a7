#include "utf8.hpp"
#include "format.hpp"
#include <cstdint>
#include <stdexcept>

void appendUtf8(std::string& out, char32_t in) {
	if (in < 0x80) {
		out += (char)in;
	} else if (in < 0x800) {
		out += (char)((in >> 6) | 0xc0);
		out += (char)((in & 0x3f) | 0x80);
	} else if (in < 0x10000) {
		out += (char)((in >> 12) | 0xe0);
		out += (char)(((in >> 6) & 0x3f) | 0x80);
		out += (char)((in & 0x3f) | 0x80);
	} else {
		out += (char)((in >> 18) | 0xf0);
		out += (char)(((in >> 12) & 0x3f) | 0x80);
		out += (char)(((in >> 6) & 0x3f) | 0x80);
		out += (char)((in & 0x3f) | 0x80);
	}
}

std::string toUtf8(const std::u32string& s) {
	std::string r;
	for (auto c : s)
		appendUtf8(r, c);
	return r;
}

std::u32string fromUtf8(const std::string& s) {
	std::u32string r;
	size_t i = 0;
	while (i < s.size()) {
		auto const lead = (uint8_t)s[i];
		int extra;
		char32_t cp;
		char32_t minimum;
		if (lead < 0x80) {
			r += (char32_t)lead;
			++i;
			continue;
		} else if ((lead & 0xe0) == 0xc0) {
			extra = 1;
			cp = lead & 0x1f;
			minimum = 0x80;
		} else if ((lead & 0xf0) == 0xe0) {
			extra = 2;
			cp = lead & 0x0f;
			minimum = 0x800;
		} else if ((lead & 0xf8) == 0xf0) {
			extra = 3;
			cp = lead & 0x07;
			minimum = 0x10000;
		} else {
			throw std::runtime_error(format("invalid UTF-8 lead byte at offset %s", i));
		}

		if (i + extra >= s.size())
			throw std::runtime_error(format("truncated UTF-8 sequence at offset %s", i));

		for (int k = 1; k <= extra; ++k) {
			auto const c = (uint8_t)s[i + k];
			if ((c & 0xc0) != 0x80)
				throw std::runtime_error(format("invalid UTF-8 continuation byte at offset %s", i + k));
			cp = (cp << 6) | (c & 0x3f);
		}

		if (cp < minimum || cp > 0x10ffff || (cp >= 0xd800 && cp <= 0xdfff))
			throw std::runtime_error(format("invalid UTF-8 code point at offset %s", i));

		r += cp;
		i += 1 + extra;
	}
	return r;
}
