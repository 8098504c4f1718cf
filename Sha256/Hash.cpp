#include"Sha256/Hash.hpp"
#include"Util/Str.hpp"
#include<string.h>

namespace Sha256 {

bool Hash::valid_string(std::string const& s) {
	return s.size() == 64 && Util::Str::ishex(s);
}

Hash::Hash(std::string const& s) : d(), valid(false) {
	if (s.size() != 64)
		throw Util::Str::HexParseFailure("Sha256::Hash needs 64 hex digits");
	auto buf = Util::Str::hexread(s);
	from_buffer(&buf[0]);
}

Hash::operator std::string() const {
	return Util::Str::hexdump(d, sizeof(d));
}

bool Hash::operator==(Hash const& o) const {
	if (valid != o.valid)
		return false;
	return memcmp(d, o.d, sizeof(d)) == 0;
}

void Hash::to_buffer(std::uint8_t out[32]) const {
	memcpy(out, d, sizeof(d));
}
void Hash::from_buffer(std::uint8_t const in[32]) {
	memcpy(d, in, sizeof(d));
	valid = true;
}

}
