#include"Secp256k1/Detail/context.hpp"
#include"Secp256k1/PrivKey.hpp"
#include"Secp256k1/XonlyPubKey.hpp"
#include"Util/Str.hpp"
#include<secp256k1.h>
#include<secp256k1_extrakeys.h>
#include<sodium/utils.h>
#include<string.h>

using Secp256k1::Detail::context;

namespace Secp256k1 {

class XonlyPubKey::Impl {
public:
	secp256k1_xonly_pubkey key;

	explicit
	Impl(std::uint8_t const buf[32]) {
		if (!secp256k1_xonly_pubkey_parse(context.get(), &key, buf))
			throw InvalidPubKey();
	}
	explicit
	Impl(PrivKey const& sk) {
		std::uint8_t skbuf[32];
		sk.to_buffer(skbuf);
		secp256k1_keypair kp;
		auto res = secp256k1_keypair_create(context.get(), &kp, skbuf);
		sodium_memzero(skbuf, sizeof(skbuf));
		if (!res)
			throw InvalidPrivKey();
		res = secp256k1_keypair_xonly_pub(context.get(), &key, nullptr, &kp);
		sodium_memzero(&kp, sizeof(kp));
		if (!res)
			throw InvalidPrivKey();
	}

	void serialize(std::uint8_t out[32]) const {
		secp256k1_xonly_pubkey_serialize(context.get(), out, &key);
	}
};

XonlyPubKey::XonlyPubKey(std::string const& s) {
	if (s.size() != 64 || !Util::Str::ishex(s))
		throw InvalidPubKey();
	auto buf = Util::Str::hexread(s);
	pimpl = std::make_shared<Impl>(&buf[0]);
}
XonlyPubKey::XonlyPubKey(PrivKey const& sk)
	: pimpl(std::make_shared<Impl>(sk)) { }

XonlyPubKey XonlyPubKey::from_buffer(std::uint8_t const buffer[32]) {
	return XonlyPubKey(Util::Str::hexdump(buffer, 32));
}
void XonlyPubKey::to_buffer(std::uint8_t buffer[32]) const {
	pimpl->serialize(buffer);
}

XonlyPubKey::operator std::string() const {
	std::uint8_t buf[32];
	pimpl->serialize(buf);
	return Util::Str::hexdump(buf, sizeof(buf));
}

bool XonlyPubKey::operator==(XonlyPubKey const& o) const {
	return secp256k1_xonly_pubkey_cmp(context.get(), &pimpl->key, &o.pimpl->key) == 0;
}

void const* XonlyPubKey::get_key() const {
	return &pimpl->key;
}

}
