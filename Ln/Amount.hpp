#ifndef LN_AMOUNT_HPP
#define LN_AMOUNT_HPP

#include<cstdint>
#include<iostream>
#include<string>

namespace Jsmn { class Object; }

namespace Ln {

/** class Ln::Amount
 *
 * @brief an exact amount of millisatoshis.
 *
 * @desc Zap amounts are compared for exact equality,
 * so this never passes through floating point.
 */
class Amount {
private:
	std::uint64_t v;

public:
	Amount() : v(0) { }
	Amount(Amount const&) =default;
	Amount& operator=(Amount const&) =default;

	/* Accepts "<n>msat", "<n>sat" or a plain "<n>"
	 * meaning millisatoshis.  */
	explicit
	Amount(std::string const&);
	/* Formats as "<n>msat".  */
	explicit
	operator std::string() const;
	/* Return false if Amount() would throw given this
	 * string.  */
	static
	bool valid_string(std::string const&);

	/* Reads the amount fields lightningd reports, which
	 * are integers (msat) on recent versions and
	 * "<n>msat" strings on older ones.
	 * Throws std::invalid_argument if neither.
	 */
	static
	Amount object(Jsmn::Object const&);

	static
	Amount sat(std::uint64_t v) {
		auto ret = Amount();
		ret.v = v * 1000;
		return ret;
	}
	static
	Amount msat(std::uint64_t v) {
		auto ret = Amount();
		ret.v = v;
		return ret;
	}

	std::uint64_t to_msat() const { return v; }

	bool operator==(Amount const& i) const { return v == i.v; }
	bool operator!=(Amount const& i) const { return v != i.v; }
	bool operator<(Amount const& i) const { return v < i.v; }
};

inline
std::ostream& operator<<(std::ostream& os, Amount const& a) {
	return os << std::string(a);
}

}

#endif /* !defined(LN_AMOUNT_HPP) */
