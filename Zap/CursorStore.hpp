#ifndef ZAP_CURSORSTORE_HPP
#define ZAP_CURSORSTORE_HPP

#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<stdexcept>
#include<string>

namespace Zap {

/* Thrown when the cursor file exists but cannot be
 * trusted.  Never recovered from automatically.  */
class CursorCorruption : public Util::BacktraceException<std::runtime_error> {
public:
	explicit
	CursorCorruption(std::string const& msg)
		: Util::BacktraceException<std::runtime_error>(
			"Cursor corruption: " + msg
		  ) { }
};

/** class Zap::CursorStore
 *
 * @brief persists the `pay_index` of the last handled
 * payment.
 *
 * @desc The file holds the index as decimal text and
 * a newline.  The 8-byte native-endian binary file that
 * older zapper plugins wrote is also accepted on load; the next
 * save rewrites it as text.
 */
class CursorStore {
private:
	std::string path;
	std::uint64_t default_index;

public:
	CursorStore() =delete;
	CursorStore( std::string path_
		   , std::uint64_t default_index_
		   ) : path(std::move(path_))
		     , default_index(default_index_)
		     { }

	std::string const& get_path() const { return path; }

	/* Returns the default index if there is no file.
	 * Throws CursorCorruption if the file is unreadable
	 * or holds anything else.  */
	std::uint64_t load() const;

	/** Zap::CursorStore::save
	 *
	 * @brief durably records `index`.
	 *
	 * @desc Writes a temporary file beside the cursor,
	 * syncs it, renames it over the cursor and syncs the
	 * directory, so a crash leaves either the old or the
	 * new value.  Missing parent directories are
	 * created.  Throws std::runtime_error on failure.
	 */
	void save(std::uint64_t index) const;
};

}

#endif /* !defined(ZAP_CURSORSTORE_HPP) */
