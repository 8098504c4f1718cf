#ifndef NOSTR_KEYS_HPP
#define NOSTR_KEYS_HPP

#include"Util/BacktraceException.hpp"
#include<stdexcept>
#include<string>

namespace Secp256k1 { class PrivKey; }

namespace Nostr {

/* Thrown when a configured key cannot be used.  */
class KeyError : public Util::BacktraceException<std::invalid_argument> {
public:
	explicit
	KeyError(std::string const& msg)
		: Util::BacktraceException<std::invalid_argument>(
			"Nostr key: " + msg
		  ) { }
};

/** Nostr::parse_secret_key
 *
 * @brief reads an operator secret key given either as
 * 64 hex digits or as a NIP-19 `nsec1...` string.
 *
 * @desc Throws KeyError on any failure.  The message
 * never includes the key text.
 */
Secp256k1::PrivKey parse_secret_key(std::string const&);

}

#endif /* !defined(NOSTR_KEYS_HPP) */
