#pragma once

#include <string>

// Appends the UTF-8 encoding of 'codepoint' to 'out'.
void appendUtf8(std::string& out, char32_t codepoint);

std::string toUtf8(const std::u32string& s);

// Throws std::runtime_error on overlong, truncated or otherwise invalid sequences.
std::u32string fromUtf8(const std::string& s);
