#ifndef UTIL_STR_HPP
#define UTIL_STR_HPP

/*
 * Minor string utilities.
 */

#ifdef HAVE_CONFIG_H
# include"config.h"
#endif

#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<stdarg.h>
#include<stdexcept>
#include<string>
#include<vector>

namespace Util {
namespace Str {

/* Outputs a two-digit lowercase hex string of the given byte.  */
std::string hexbyte(std::uint8_t);
/* Outputs the given data as lowercase hex.  */
std::string hexdump(void const* p, std::size_t s);

/* Creates a buffer from the given hex string.  */
struct HexParseFailure : public Util::BacktraceException<std::runtime_error> {
	HexParseFailure(std::string msg)
		: Util::BacktraceException<std::runtime_error>("hexread: " + msg) { }
};
std::vector<std::uint8_t> hexread(std::string const&);

/* Checks that the given string is a hex string with an
 * even number of digits.
 */
bool ishex(std::string const&);
/* Checks that the given string is exactly `len` lowercase
 * hex digits, the form Nostr uses for ids and keys.
 */
bool islowerhex(std::string const&, std::size_t len);

std::string trim(std::string const& s);

/* Parses a plain unsigned decimal with no sign, no
 * whitespace, and no overflow.  Returns false on any
 * deviation.
 */
bool parse_u64(std::string const& s, std::uint64_t& out);

/* Decodes `%XX` escapes, also mapping `+` to space.
 * Throws std::invalid_argument on a truncated or non-hex
 * escape.
 */
std::string percent_decode(std::string const& s);

/* Like `sprintf`.  */
std::string fmt(char const *tpl, ...)
#if HAVE_ATTRIBUTE_FORMAT
	__attribute__ ((format (printf, 1, 2)))
#endif
;
std::string vfmt(char const *tpl, va_list ap);

}}

#endif /* !defined(UTIL_STR_HPP) */
