#ifndef SECP256K1_PRIVKEY_HPP
#define SECP256K1_PRIVKEY_HPP

#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<stdexcept>
#include<string>

namespace Secp256k1 { class Random; }

namespace Secp256k1 {

/* Thrown if caller-provided data would result in an invalid
 * private key.
 */
class InvalidPrivKey : public Util::BacktraceException<std::invalid_argument> {
public:
	InvalidPrivKey()
		: Util::BacktraceException<std::invalid_argument>("Invalid private key.") { }
};

/** class Secp256k1::PrivKey
 *
 * @brief a secp256k1 scalar usable as a signing key.
 *
 * @desc Always holds a valid key (nonzero, below the
 * group order); constructors throw InvalidPrivKey
 * otherwise.  The key bytes are wiped on destruction.
 */
class PrivKey {
private:
	std::uint8_t key[32];

	explicit
	PrivKey(std::uint8_t const key_[32]);

public:
	/* Load private key from a hex-encoded string.  */
	explicit PrivKey(std::string const&);
	/* Pick a random private key.  */
	explicit PrivKey(Secp256k1::Random& rand);
	PrivKey(PrivKey const&);
	PrivKey& operator=(PrivKey const&);
	~PrivKey();

	static PrivKey from_buffer(std::uint8_t const buffer[32]) {
		return PrivKey(buffer);
	}
	void to_buffer(std::uint8_t buffer[32]) const;

	/* Constant-time comparison.  */
	bool operator==(PrivKey const& o) const;
	bool operator!=(PrivKey const& o) const {
		return !(*this == o);
	}
};

}

#endif /* !defined(SECP256K1_PRIVKEY_HPP) */
