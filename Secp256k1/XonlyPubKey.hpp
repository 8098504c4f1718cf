#ifndef SECP256K1_XONLYPUBKEY_HPP
#define SECP256K1_XONLYPUBKEY_HPP

#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<memory>
#include<ostream>
#include<stdexcept>
#include<string>

namespace Secp256k1 { class PrivKey; }
namespace Secp256k1 { class SchnorrSig; }

namespace Secp256k1 {

/* Thrown if caller-provided data is not a point on the curve.  */
class InvalidPubKey : public Util::BacktraceException<std::invalid_argument> {
public:
	InvalidPubKey()
		: Util::BacktraceException<std::invalid_argument>("Invalid public key.") { }
};

/** class Secp256k1::XonlyPubKey
 *
 * @brief BIP-340 32-byte x-only public key, the form
 * Nostr uses for every author and recipient key.
 */
class XonlyPubKey {
private:
	class Impl;
	std::shared_ptr<Impl> pimpl;

	friend class SchnorrSig;
	void const* get_key() const;

public:
	XonlyPubKey() =delete;
	XonlyPubKey(XonlyPubKey const&) =default;
	XonlyPubKey& operator=(XonlyPubKey const&) =default;

	/* Parse 64 hex digits; throws InvalidPubKey.  */
	explicit XonlyPubKey(std::string const&);
	/* Derive from a private key.  */
	explicit XonlyPubKey(Secp256k1::PrivKey const&);

	static XonlyPubKey from_buffer(std::uint8_t const buffer[32]);
	void to_buffer(std::uint8_t buffer[32]) const;

	/* 64 lowercase hex digits.  */
	explicit operator std::string() const;

	bool operator==(XonlyPubKey const&) const;
	bool operator!=(XonlyPubKey const& o) const {
		return !(*this == o);
	}
};

inline
std::ostream& operator<<(std::ostream& os, XonlyPubKey const& pk) {
	return os << std::string(pk);
}

}

#endif /* !defined(SECP256K1_XONLYPUBKEY_HPP) */
