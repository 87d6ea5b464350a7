// Simplistic standalone JSON-parser

#include "json.hpp"
#include "utf8.hpp"
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace json {
namespace {

struct Token {
	enum Type {
		EOF_ = 0,
		LBRACE,
		RBRACE,
		LBRACKET,
		RBRACKET,
		STRING,
		NUMBER,
		BOOLEAN,
		NULL_,
		COLON,
		COMMA,
	};

	std::string lexem;
	Type type;
};

int hexDigit(char c) {
	if(c >= '0' && c <= '9')
		return c - '0';
	if(c >= 'a' && c <= 'f')
		return c - 'a' + 10;
	if(c >= 'A' && c <= 'F')
		return c - 'A' + 10;
	throw std::runtime_error(std::string("Invalid hex digit '") + c + "' in \\u escape");
}

class Tokenizer {
	public:
		Tokenizer(const char* text_, size_t len) {
			text = text_;
			textEnd = text_ + len;
			decodeToken();
		}

		const Token& front() const {
			return curr;
		}
		void popFront() {
			decodeToken();
		}

	private:
		void decodeToken() {
			while(whitespace(frontChar()))
				++text;

			curr.lexem = "";
			switch(frontChar()) {
			case '\0':
				curr.type = Token::EOF_;
				break;
			case '[':
				accept();
				curr.type = Token::LBRACKET;
				break;
			case ']':
				accept();
				curr.type = Token::RBRACKET;
				break;
			case '{':
				accept();
				curr.type = Token::LBRACE;
				break;
			case '}':
				accept();
				curr.type = Token::RBRACE;
				break;
			case ':':
				accept();
				curr.type = Token::COLON;
				break;
			case ',':
				accept();
				curr.type = Token::COMMA;
				break;
			case '"':
				++text;
				curr.type = Token::STRING;
				curr.lexem = decodeString();
				break;
			case 't':
				curr.type = Token::BOOLEAN;
				expect("true");
				break;
			case 'f':
				curr.type = Token::BOOLEAN;
				expect("false");
				break;
			case 'n':
				curr.type = Token::NULL_;
				expect("null");
				break;
			case '-': case '0': case '1': case '2':
			case '3': case '4': case '5': case '6':
			case '7': case '8': case '9': {
				curr.type = Token::NUMBER;

				if(frontChar() == '-')
					accept();

				while(isdigit(frontChar()))
					accept();

				break;
			}
			default: {
				std::string msg = "Unknown char '";
				msg += frontChar();
				msg += "'";
				throw std::runtime_error(msg);
			}
			}
		}

		// called after the opening quote, consumes the closing one
		std::string decodeString() {
			std::string r;
			while(frontChar() != '"') {
				if(text >= textEnd)
					throw std::runtime_error("Unterminated string");

				if(frontChar() != '\\') {
					r += frontChar();
					++text;
					continue;
				}

				++text;
				auto const c = frontChar();
				++text;
				switch(c) {
				case '"': r += '"'; break;
				case '\\': r += '\\'; break;
				case '/': r += '/'; break;
				case 'b': r += '\b'; break;
				case 'f': r += '\f'; break;
				case 'n': r += '\n'; break;
				case 'r': r += '\r'; break;
				case 't': r += '\t'; break;
				case 'u': {
					auto codepoint = parseHex4();
					if(codepoint >= 0xd800 && codepoint <= 0xdbff) {
						// surrogate pair
						if(frontChar() != '\\' || text + 1 >= textEnd || text[1] != 'u')
							throw std::runtime_error("Unpaired surrogate in \\u escape");
						text += 2;
						auto const low = parseHex4();
						if(low < 0xdc00 || low > 0xdfff)
							throw std::runtime_error("Invalid low surrogate in \\u escape");
						codepoint = 0x10000 + ((codepoint - 0xd800) << 10) + (low - 0xdc00);
					}
					appendUtf8(r, codepoint);
					break;
				}
				default:
					throw std::runtime_error(std::string("Invalid escape sequence '\\") + c + "'");
				}
			}
			++text;
			return r;
		}

		char32_t parseHex4() {
			char32_t r = 0;
			for(int i = 0; i < 4; ++i) {
				r = (r << 4) | hexDigit(frontChar());
				++text;
			}
			return r;
		}

		void expect(const char* word) {
			for(auto p = word; *p; ++p) {
				if(frontChar() != *p)
					throw std::runtime_error("Unexpected character");
				accept();
			}
		}

		void accept() {
			curr.lexem += frontChar();
			++text;
		}

		char frontChar() const {
			if(text >= textEnd)
				return 0;

			return *text;
		}

		static bool whitespace(char c) {
			return c == ' ' || c == '\n' || c == '\r' || c == '\t';
		}

		const char* text;
		const char* textEnd;
		Token curr;
};

std::string expect(Tokenizer& tk, Token::Type type) {
	auto front = tk.front();

	if(front.type != type) {
		std::string msg;

		if(front.type == Token::EOF_)
			msg += "Unexpected end of file found";
		else {
			msg += "Unexpected token '" + front.lexem + "'";
			msg += " of type " + std::to_string(front.type);
			msg += " instead of " + std::to_string(type);
		}

		throw std::runtime_error(msg);
	}

	auto r = front.lexem;
	tk.popFront();
	return r;
}

Value parseValue(Tokenizer& tk);

Value parseObject(Tokenizer& tk) {
	Value r;
	r.type = Value::Type::Object;
	expect(tk, Token::LBRACE);
	int idx = 0;

	while(tk.front().type != Token::RBRACE) {
		if(idx > 0)
			expect(tk, Token::COMMA);

		auto const name = expect(tk, Token::STRING);
		expect(tk, Token::COLON);
		r.objectValue[name] = parseValue(tk);
		++idx;
	}

	expect(tk, Token::RBRACE);
	return r;
}

Value parseArray(Tokenizer& tk) {
	Value r;
	r.type = Value::Type::Array;
	expect(tk, Token::LBRACKET);
	int idx = 0;

	while(tk.front().type != Token::RBRACKET) {
		if(idx > 0)
			expect(tk, Token::COMMA);

		r.arrayValue.push_back(parseValue(tk));
		++idx;
	}

	expect(tk, Token::RBRACKET);
	return r;
}

Value parseValue(Tokenizer& tk) {
	switch(tk.front().type) {
	case Token::LBRACKET:
		return parseArray(tk);
	case Token::LBRACE:
		return parseObject(tk);
	case Token::BOOLEAN: {
		Value r;
		r.type = Value::Type::Boolean;
		r.boolValue = expect(tk, Token::BOOLEAN) == "true";
		return r;
	}
	case Token::NULL_: {
		expect(tk, Token::NULL_);
		return Value();
	}
	case Token::NUMBER: {
		Value r;
		r.type = Value::Type::Integer;
		r.intValue = atoi(expect(tk, Token::NUMBER).c_str());
		return r;
	}
	default: {
		Value r;
		r.type = Value::Type::String;
		r.stringValue = expect(tk, Token::STRING);
		return r;
	}
	}
}
} /*anonymous*/

void Value::enforceType(Type expected) const {
	if(type != expected)
		throw std::runtime_error("Type error");
}

Value const& Value::operator[] (const char* name) const {
	enforceType(Type::Object);
	auto it = objectValue.find(name);
	if(it == objectValue.end())
		throw std::runtime_error("Member '" + std::string(name) + "' was not found");

	return (*it).value;
}

bool Value::has(const char* name) const {
	return type == Type::Object && objectValue.contains(name);
}

Value const& Value::operator[] (int i) const {
	enforceType(Type::Array);
	if(i < 0 || i >= (int)arrayValue.size())
		throw std::runtime_error("Array index " + std::to_string(i) + " out of range");
	return arrayValue[i];
}

Value parse(const std::string &s) {
	Tokenizer tokenizer(s.c_str(), s.size());
	auto r = parseObject(tokenizer);
	expect(tokenizer, Token::EOF_);
	return r;
}
}
