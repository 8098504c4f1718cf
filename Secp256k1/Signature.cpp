#include"Secp256k1/Detail/context.hpp"
#include"Secp256k1/PrivKey.hpp"
#include"Secp256k1/Random.hpp"
#include"Secp256k1/Signature.hpp"
#include"Secp256k1/XonlyPubKey.hpp"
#include"Sha256/Hash.hpp"
#include"Util/Str.hpp"
#include<secp256k1.h>
#include<secp256k1_extrakeys.h>
#include<secp256k1_schnorrsig.h>
#include<sodium/utils.h>
#include<string.h>

using Secp256k1::Detail::context;

namespace Secp256k1 {

SchnorrSig::SchnorrSig() {
	memset(data, 0, sizeof(data));
}
SchnorrSig::SchnorrSig(std::uint8_t const buffer[64]) {
	memcpy(data, buffer, sizeof(data));
}
SchnorrSig::SchnorrSig(std::string const& s) {
	if (s.size() != 128)
		throw Util::Str::HexParseFailure("signature needs 128 hex digits");
	auto buf = Util::Str::hexread(s);
	memcpy(data, &buf[0], sizeof(data));
}

SchnorrSig::operator std::string() const {
	return Util::Str::hexdump(data, sizeof(data));
}

void SchnorrSig::to_buffer(std::uint8_t buffer[64]) const {
	memcpy(buffer, data, sizeof(data));
}

bool SchnorrSig::valid( XonlyPubKey const& pk
		      , Sha256::Hash const& m
		      ) const {
	std::uint8_t mbuf[32];
	m.to_buffer(mbuf);
	auto res = secp256k1_schnorrsig_verify
		( context.get()
		, data
		, mbuf, sizeof(mbuf)
		, reinterpret_cast<secp256k1_xonly_pubkey const*>(pk.get_key())
		);
	return res != 0;
}

SchnorrSig SchnorrSig::create( PrivKey const& sk
			     , Sha256::Hash const& m
			     , Random& rand
			     ) {
	std::uint8_t mbuf[32];
	m.to_buffer(mbuf);
	std::uint8_t skbuf[32];
	sk.to_buffer(skbuf);
	std::uint8_t aux[32];
	rand.fill(aux, sizeof(aux));

	secp256k1_keypair kp;
	auto res = secp256k1_keypair_create(context.get(), &kp, skbuf);
	sodium_memzero(skbuf, sizeof(skbuf));
	if (!res)
		throw InvalidPrivKey();

	auto rv = SchnorrSig();
	res = secp256k1_schnorrsig_sign32( context.get()
					 , rv.data
					 , mbuf
					 , &kp
					 , aux
					 );
	sodium_memzero(&kp, sizeof(kp));
	if (!res)
		throw InvalidPrivKey();
	return rv;
}

}
