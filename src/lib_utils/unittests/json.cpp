#include "lib_utils/json.hpp"
#include "tests/tests.hpp"
#include <vector>

using namespace std;

namespace {
bool jsonOk(string text) {
	try {
		json::parse(text);
		return true;
	} catch(exception const &) {
		return false;
	}
}
}

unittest("Json parser: empty") {
	ASSERT(jsonOk("{}"));
	ASSERT(!jsonOk("{"));
}

unittest("Json parser: objectValue") {
	ASSERT(jsonOk("{ \"var\": 0 }"));
	ASSERT(jsonOk("{ \"var\": -10 }"));
	ASSERT(jsonOk("{ \"hello\": \"world\" }"));
	ASSERT(jsonOk("{ \"N1\": \"V1\", \"N2\": \"V2\" }"));
	ASSERT(jsonOk("{ \"nothing\": null }"));

	ASSERT(!jsonOk("{ \"N1\" : : \"V2\" }"));
}

unittest("Json parser: trailing garbage") {
	ASSERT(!jsonOk("{ \"isCool\" : true } _invalid_json_token_"));
	ASSERT(!jsonOk("{ \"isCool\" : true } {}"));
}

unittest("Json parser: arrays") {
	ASSERT(jsonOk("{ \"A\": [] }"));
	ASSERT(jsonOk("{ \"A\": [ { }, { } ] }"));
	ASSERT(jsonOk("{ \"A\": [ \"hello\", \"world\" ] }"));

	ASSERT(!jsonOk("{ \"A\": [ }"));
	ASSERT(!jsonOk("{ \"A\": ] }"));

	auto o = json::parse("{ \"A\": [ 4, 5 ] }");
	ASSERT_EQUALS(5, (int)o["A"][1]);
	ASSERT_THROWN(o["A"][2]);
}

unittest("Json parser: string escapes") {
	auto o = json::parse(R"({ "s": "a\"b\\c\/d\ne\tf" })");
	ASSERT_EQUALS("a\"b\\c/d\ne\tf", o["s"].stringValue);
}

unittest("Json parser: unicode escapes are decoded to UTF-8") {
	auto o = json::parse(R"({ "s": "\u00e4\u20ac\ud83d\ude00\u003c<" })");
	ASSERT_EQUALS("\xc3\xa4\xe2\x82\xac\xf0\x9f\x98\x80<<", o["s"].stringValue);
	ASSERT(!jsonOk(R"({ "s": "\u12" })"));
	ASSERT(!jsonOk(R"({ "s": "\ud83d" })"));
	ASSERT(!jsonOk(R"({ "s": "\q" })"));
	ASSERT(!jsonOk(R"({ "s": "unterminated )"));
}

unittest("Json parser: member lookup") {
	auto o = json::parse("{ \"N\" : \"hello\", \"M\": { \"deep\": true } }");
	ASSERT(o.has("N"));
	ASSERT(!o.has("missing"));
	ASSERT(o["M"]["deep"].boolValue);
	ASSERT_THROWN(o["missing"]);
	ASSERT(!o["N"].has("N"));
}

unittest("Json parser: returned value") {
	{
		auto o = json::parse("{}");
		ASSERT_EQUALS(0u, o.objectValue.size());
	}
	{
		auto o = json::parse("{ \"N\" : \"hello\"}");
		ASSERT_EQUALS(1u, o.objectValue.size());
		auto s = o.objectValue["N"];
		ASSERT_EQUALS("hello", s.stringValue);
	}
	{
		auto o = json::parse("{ \"N\" : -1234 }");
		ASSERT_EQUALS(1u, o.objectValue.size());
		auto s = o.objectValue["N"];
		ASSERT_EQUALS((int)json::Value::Type::Integer, (int)s.type);
		ASSERT_EQUALS(-1234, s.intValue);
	}
}
