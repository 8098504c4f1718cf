#ifndef SHA256_HASH_HPP
#define SHA256_HASH_HPP

#include<cstdint>
#include<iostream>
#include<string>

namespace Sha256 { class Hasher; }

namespace Sha256 {

/** class Sha256::Hash
 *
 * @brief a 32-byte SHA-256 digest.
 *
 * @desc A default-constructed hash is invalid (false)
 * until assigned.  In Nostr, event ids are exactly such
 * digests, written as 64 lowercase hex digits.
 */
class Hash {
private:
	std::uint8_t d[32];
	bool valid;

	friend class Sha256::Hasher;

public:
	Hash() : d(), valid(false) { }

	static
	bool valid_string(std::string const&);
	/* Throws Util::Str::HexParseFailure on bad input.  */
	explicit
	Hash(std::string const&);

	explicit
	operator std::string() const;

	explicit
	operator bool() const { return valid; }
	bool operator!() const { return !valid; }

	bool operator==(Hash const&) const;
	bool operator!=(Hash const& o) const {
		return !(*this == o);
	}

	void to_buffer(std::uint8_t out[32]) const;
	void from_buffer(std::uint8_t const in[32]);
};

inline
std::ostream& operator<<(std::ostream& os, Hash const& h) {
	return os << std::string(h);
}

}

#endif /* !defined(SHA256_HASH_HPP) */
