#include"Secp256k1/Detail/context.hpp"
#include"Secp256k1/PrivKey.hpp"
#include"Secp256k1/Random.hpp"
#include"Util/Str.hpp"
#include<secp256k1.h>
#include<sodium/utils.h>
#include<string.h>

using Secp256k1::Detail::context;

namespace Secp256k1 {

PrivKey::PrivKey(std::uint8_t const key_[32]) {
	memcpy(key, key_, sizeof(key));
	if (!secp256k1_ec_seckey_verify(context.get(), key)) {
		sodium_memzero(key, sizeof(key));
		throw InvalidPrivKey();
	}
}

PrivKey::PrivKey(std::string const& s) {
	if (s.size() != 64 || !Util::Str::ishex(s))
		throw InvalidPrivKey();
	auto buf = Util::Str::hexread(s);
	memcpy(key, &buf[0], sizeof(key));
	sodium_memzero(&buf[0], buf.size());
	if (!secp256k1_ec_seckey_verify(context.get(), key)) {
		sodium_memzero(key, sizeof(key));
		throw InvalidPrivKey();
	}
}

PrivKey::PrivKey(Secp256k1::Random& rand) {
	do {
		for (auto& b : key)
			b = rand.get();
	} while (!secp256k1_ec_seckey_verify(context.get(), key));
}

PrivKey::PrivKey(PrivKey const& o) {
	memcpy(key, o.key, sizeof(key));
}
PrivKey& PrivKey::operator=(PrivKey const& o) {
	memcpy(key, o.key, sizeof(key));
	return *this;
}
PrivKey::~PrivKey() {
	sodium_memzero(key, sizeof(key));
}

void PrivKey::to_buffer(std::uint8_t buffer[32]) const {
	memcpy(buffer, key, sizeof(key));
}

bool PrivKey::operator==(PrivKey const& o) const {
	return sodium_memcmp(key, o.key, sizeof(key)) == 0;
}

}
