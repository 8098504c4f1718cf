#include"Nostr/Keys.hpp"
#include"Secp256k1/PrivKey.hpp"
#include"Util/Bech32.hpp"
#include"Util/Str.hpp"
#include<cstdint>
#include<sodium/utils.h>
#include<vector>

namespace Nostr {

Secp256k1::PrivKey parse_secret_key(std::string const& s_) {
	auto s = Util::Str::trim(s_);
	if (s.empty())
		throw KeyError("empty");

	auto bytes = std::vector<std::uint8_t>();
	if (s.size() == 64 && Util::Str::ishex(s)) {
		bytes = Util::Str::hexread(s);
	} else {
		auto hrp = std::string();
		if (!Util::Bech32::decode(hrp, bytes, s))
			throw KeyError("neither hex nor valid bech32");
		if (hrp != "nsec") {
			sodium_memzero(bytes.data(), bytes.size());
			throw KeyError("bech32 prefix is " + hrp + ", not nsec");
		}
		if (bytes.size() != 32) {
			sodium_memzero(bytes.data(), bytes.size());
			throw KeyError("nsec payload is not 32 bytes");
		}
	}

	try {
		auto rv = Secp256k1::PrivKey::from_buffer(bytes.data());
		sodium_memzero(bytes.data(), bytes.size());
		return rv;
	} catch (Secp256k1::InvalidPrivKey const&) {
		sodium_memzero(bytes.data(), bytes.size());
		throw KeyError("not a valid secp256k1 scalar");
	}
}

}
