#ifndef UTIL_BECH32_HPP
#define UTIL_BECH32_HPP

#include<cstdint>
#include<string>
#include<vector>

namespace Util { namespace Bech32 {

/** Util::Bech32::decode
 *
 * @brief decode a BIP-173 bech32 string into its
 * human-readable part and its payload bytes.
 *
 * @return true if decoding succeeded.
 *
 * @desc Unlike invoices received from other software,
 * the strings decoded here are typed in by an operator
 * (e.g. an `nsec1...` key), so the checksum is verified.
 * Mixed-case input is rejected, the HRP is returned in
 * lowercase, and the 5-bit groups are regrouped into
 * bytes with any padding required to be zero.
 */
bool decode( std::string& hrp
	   , std::vector<std::uint8_t>& bytes
	   , std::string const& bech32
	   );

}}

#endif /* !defined(UTIL_BECH32_HPP) */
