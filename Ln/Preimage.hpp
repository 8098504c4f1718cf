#ifndef LN_PREIMAGE_HPP
#define LN_PREIMAGE_HPP

#include<cstdint>
#include<string>

namespace Sha256 { class Hash; }

namespace Ln {

/** class Ln::Preimage
 *
 * @brief the 32-byte secret revealed when an invoice
 * is paid, the proof of settlement.
 */
class Preimage {
private:
	std::uint8_t data[32];
	bool set;

public:
	Preimage() : data(), set(false) { }

	static
	bool valid_string(std::string const&);
	/* Throws Util::Str::HexParseFailure.  */
	explicit
	Preimage(std::string const&);

	/* Lowercase hex.  */
	explicit
	operator std::string() const;

	bool operator==(Preimage const&) const;
	bool operator!=(Preimage const& o) const {
		return !(*this == o);
	}

	explicit
	operator bool() const { return set; }
	bool operator!() const { return !set; }

	void to_buffer(std::uint8_t out[32]) const;
	void from_buffer(std::uint8_t const in[32]);

	/* The payment hash this preimage unlocks.  */
	Sha256::Hash sha256() const;
};

}

#endif /* !defined(LN_PREIMAGE_HPP) */
