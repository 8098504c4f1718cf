#ifndef JSMN_DETAIL_STR_HPP
#define JSMN_DETAIL_STR_HPP

#include<string>

namespace Jsmn { namespace Detail { namespace Str {

/* Escapes for inclusion between JSON double quotes.
 * Bytes at or above 0x80 pass through, so UTF-8 text
 * is kept as-is.
 */
std::string to_escaped(std::string const&);
/* Decodes the inside of a JSON string literal into
 * UTF-8, combining UTF-16 surrogate pairs.
 */
std::string from_escaped(std::string const&);

double to_double(std::string const&);
std::string from_double(double);

}}}

#endif /* !defined(JSMN_DETAIL_STR_HPP) */
