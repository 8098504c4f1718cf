#ifndef SECP256K1_SIGNATURE_HPP
#define SECP256K1_SIGNATURE_HPP

#include<cstdint>
#include<string>

namespace Secp256k1 { class PrivKey; }
namespace Secp256k1 { class Random; }
namespace Secp256k1 { class XonlyPubKey; }
namespace Sha256 { class Hash; }

namespace Secp256k1 {

/** class Secp256k1::SchnorrSig
 *
 * @brief a 64-byte BIP-340 signature over a 32-byte
 * message hash.
 */
class SchnorrSig {
private:
	std::uint8_t data[64];

	explicit
	SchnorrSig(std::uint8_t const buffer[64]);

public:
	SchnorrSig();
	SchnorrSig(SchnorrSig const&) =default;
	SchnorrSig& operator=(SchnorrSig const&) =default;

	/* 128 hex digits; throws Util::Str::HexParseFailure.  */
	explicit SchnorrSig(std::string const&);
	explicit operator std::string() const;

	static
	SchnorrSig from_buffer(std::uint8_t const buffer[64]) {
		return SchnorrSig(buffer);
	}
	void to_buffer(std::uint8_t buffer[64]) const;

	/* Check if the signature is valid for the given pubkey
	 * and message hash.
	 */
	bool valid( Secp256k1::XonlyPubKey const& pk
		  , Sha256::Hash const& m
		  ) const;

	/* Sign with fresh auxiliary randomness from `rand`.
	 * Throws InvalidPrivKey if signing fails.
	 */
	static
	SchnorrSig create( Secp256k1::PrivKey const& sk
			 , Sha256::Hash const& m
			 , Secp256k1::Random& rand
			 );
};

}

#endif /* !defined(SECP256K1_SIGNATURE_HPP) */
