#ifndef UTIL_RW_HPP
#define UTIL_RW_HPP

#include<cstdint>
#include<cstdlib>
#include<vector>

namespace Util { namespace Rw {

/* Return true if successful, false if not; errno is
 * left as set by the failing call.
 */
bool write_all(int fd, void const* p, std::size_t size);

/* Reads until end-of-file, appending to `out`.
 * Return true if EOF was reached, false on a read
 * error (`out` then holds whatever was read so far).
 */
bool read_to_end(int fd, std::vector<std::uint8_t>& out);

}}

#endif /* !defined(UTIL_RW_HPP) */
