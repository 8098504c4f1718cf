#undef NDEBUG
#include"Jsmn/Object.hpp"
#include"Jsmn/ParseError.hpp"
#include"Jsmn/Parser.hpp"
#include<assert.h>
#include<string>

int main() {
	{
		/* Pieces may split a datum anywhere.  */
		auto parser = Jsmn::Parser();
		auto r = parser.feed("{\"id\": 1, \"me");
		assert(r.empty());
		assert(!parser.empty());
		r = parser.feed("thod\": \"getmanifest\"}\n\n{\"id\"");
		assert(r.size() == 1);
		assert(r[0].is_object());
		assert(std::string(r[0]["method"]) == "getmanifest");
		assert(double(r[0]["id"]) == 1);
		r = parser.feed(": \"a\"}");
		assert(r.size() == 1);
		assert(r[0]["id"].is_string());
		assert(r[0]["id"].direct_text() == "\"a\"");
		assert(parser.empty());
	}
	{
		auto js = Jsmn::Object::parse_json(
			"[\"OK\", \"abc\", true, \"duplicate: \\\"x\\\"\"]"
		);
		assert(js.is_array());
		assert(js.size() == 4);
		assert(js[2].is_boolean());
		assert(bool(js[2]));
		assert(std::string(js[3]) == "duplicate: \"x\"");
		assert(js[7].is_null());
		assert(js["missing"].is_null());
	}
	{
		auto js = Jsmn::Object::parse_json("{\"a\":{\"b\":[1,2]},\"c\":null}");
		assert(js.has("a"));
		assert(js.has("c"));
		assert(js["c"].is_null());
		assert(!js.has("d"));
		assert(js["a"]["b"].size() == 2);
		auto keys = js.keys();
		assert(keys.size() == 2);
	}
	{
		/* Exactly one complete datum.  */
		auto threw = false;
		try {
			Jsmn::Object::parse_json("{\"a\":1} {\"b\":2}");
		} catch (Jsmn::ParseError const&) {
			threw = true;
		}
		assert(threw);

		threw = false;
		try {
			Jsmn::Object::parse_json("{\"a\":");
		} catch (Jsmn::ParseError const&) {
			threw = true;
		}
		assert(threw);
	}
	{
		/* Type errors on mismatched access.  */
		auto js = Jsmn::Object::parse_json("{\"a\":\"x\"}");
		auto threw = false;
		try {
			(void) double(js["a"]);
		} catch (Jsmn::TypeError const&) {
			threw = true;
		}
		assert(threw);
	}

	return 0;
}
