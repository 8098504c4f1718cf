#include"Ln/Preimage.hpp"
#include"Sha256/fun.hpp"
#include"Util/Str.hpp"
#include<string.h>

namespace Ln {

bool Preimage::valid_string(std::string const& s) {
	return s.size() == 64 && Util::Str::ishex(s);
}

Preimage::Preimage(std::string const& s) : data(), set(false) {
	if (!valid_string(s))
		throw Util::Str::HexParseFailure("preimage needs 64 hex digits");
	auto buf = Util::Str::hexread(s);
	from_buffer(&buf[0]);
}

Preimage::operator std::string() const {
	return Util::Str::hexdump(data, sizeof(data));
}

bool Preimage::operator==(Preimage const& o) const {
	return set == o.set && memcmp(data, o.data, sizeof(data)) == 0;
}

void Preimage::to_buffer(std::uint8_t out[32]) const {
	memcpy(out, data, sizeof(data));
}
void Preimage::from_buffer(std::uint8_t const in[32]) {
	memcpy(data, in, sizeof(data));
	set = true;
}

Sha256::Hash Preimage::sha256() const {
	return Sha256::fun(data, sizeof(data));
}

}
