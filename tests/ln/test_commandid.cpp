#undef NDEBUG
#include"Jsmn/Object.hpp"
#include"Ln/CommandId.hpp"
#include<assert.h>

int main() {
	auto js = Jsmn::Object::parse_json(
		"{\"n\": 42, \"s\": \"cln:init#7\", \"o\": {}}"
	);

	auto n = Ln::CommandId::from_json(js["n"]);
	assert(n.json() == "42");
	auto s = Ln::CommandId::from_json(js["s"]);
	/* Echoed back exactly, quotes included.  */
	assert(s.json() == "\"cln:init#7\"");
	assert(n != s);
	assert(s == Ln::CommandId::from_json(js["s"]));

	auto threw = false;
	try {
		Ln::CommandId::from_json(js["o"]);
	} catch (Jsmn::TypeError const&) {
		threw = true;
	}
	assert(threw);

	assert(Ln::CommandId().json() == "null");

	return 0;
}
