#undef NDEBUG
#include"Util/Str.hpp"
#include<assert.h>
#include<cstdint>
#include<stdexcept>

int main() {
	assert(Util::Str::trim("  x y \n") == "x y");
	assert(Util::Str::trim(" \t ") == "");

	auto v = std::uint64_t();
	assert(Util::Str::parse_u64("18446744073709551615", v));
	assert(v == 18446744073709551615ULL);
	assert(!Util::Str::parse_u64("18446744073709551616", v));
	assert(!Util::Str::parse_u64("", v));
	assert(!Util::Str::parse_u64("+1", v));
	assert(!Util::Str::parse_u64("1 ", v));

	assert(Util::Str::percent_decode("%7B%22a%22%3A1%7D") == "{\"a\":1}");
	assert(Util::Str::percent_decode("a+b") == "a b");
	auto threw = false;
	try {
		Util::Str::percent_decode("100%");
	} catch (std::invalid_argument const&) {
		threw = true;
	}
	assert(threw);
	threw = false;
	try {
		Util::Str::percent_decode("%zz");
	} catch (std::invalid_argument const&) {
		threw = true;
	}
	assert(threw);

	assert(Util::Str::islowerhex(std::string(64, 'a'), 64));
	assert(!Util::Str::islowerhex(std::string(64, 'A'), 64));
	assert(!Util::Str::islowerhex(std::string(63, 'a'), 64));
	assert(Util::Str::ishex("00FFaa"));

	auto bytes = Util::Str::hexread("00ff10");
	assert(bytes.size() == 3);
	assert(bytes[1] == 0xff);
	assert(Util::Str::hexdump(bytes.data(), bytes.size()) == "00ff10");

	assert(Util::Str::fmt("%s %zu", "n", std::size_t(3)) == "n 3");

	return 0;
}
