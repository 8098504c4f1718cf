#undef NDEBUG
#include"Jsmn/Object.hpp"
#include"Ln/Amount.hpp"
#include<assert.h>
#include<stdexcept>

int main() {
	assert(Ln::Amount::sat(50) == Ln::Amount::msat(50000));
	assert(Ln::Amount::msat(50000).to_msat() == 50000);
	assert(std::string(Ln::Amount::sat(1)) == "1000msat");

	assert(Ln::Amount("5000msat") == Ln::Amount::msat(5000));
	assert(Ln::Amount("5sat") == Ln::Amount::msat(5000));
	assert(Ln::Amount("5000") == Ln::Amount::msat(5000));
	assert(Ln::Amount::msat(4000) < Ln::Amount::msat(5000));

	assert(Ln::Amount::valid_string("0msat"));
	assert(!Ln::Amount::valid_string("msat"));
	assert(!Ln::Amount::valid_string("-1msat"));
	assert(!Ln::Amount::valid_string("1.5sat"));
	assert(!Ln::Amount::valid_string("99999999999999999999sat"));

	auto threw = false;
	try {
		Ln::Amount("lots");
	} catch (std::invalid_argument const&) {
		threw = true;
	}
	assert(threw);

	/* lightningd reports amounts as numbers or strings.  */
	auto js = Jsmn::Object::parse_json(
		"{\"a\": 50000, \"b\": \"50000msat\"}"
	);
	assert(Ln::Amount::object(js["a"]) == Ln::Amount::msat(50000));
	assert(Ln::Amount::object(js["b"]) == Ln::Amount::msat(50000));

	return 0;
}
