#undef NDEBUG
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include<assert.h>
#include<string>
#include<vector>

int main() {
	auto js = Json::Out()
		.start_object()
			.field("jsonrpc", std::string("2.0"))
			.field("id", 42)
			.start_object("params")
				.field("level", std::string("info"))
				.field("message", std::string("tab\there \"quoted\""))
				.field("relays", std::vector<std::string>{"wss://a", "wss://b"})
				.field("strict", false)
			.end_object()
			.field("result", Json::Out::direct("null"))
		.end_object()
		;

	auto parsed = Jsmn::Object::parse_json(js.output());
	assert(parsed.is_object());
	assert(std::string(parsed["jsonrpc"]) == "2.0");
	assert(double(parsed["id"]) == 42);
	auto params = parsed["params"];
	assert(std::string(params["message"]) == "tab\there \"quoted\"");
	assert(params["relays"].size() == 2);
	assert(std::string(params["relays"][1]) == "wss://b");
	assert(params["strict"].is_boolean());
	assert(!bool(params["strict"]));
	assert(parsed.has("result"));
	assert(parsed["result"].is_null());

	assert(Json::Out::empty_object().output() == "{}");

	/* Round-trip of parsed JSON keeps the text.  */
	auto again = Json::Out(parsed["params"]["relays"]);
	assert(again.output() == "[\"wss://a\",\"wss://b\"]");

	return 0;
}
