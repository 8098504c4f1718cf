#ifndef SQLITE3_DB_HPP
#define SQLITE3_DB_HPP

#include<memory>
#include<string>

namespace Ev { template<typename a> class Io; }
namespace Sqlite3 { class Tx; }

namespace Sqlite3 {

/** class Sqlite3::Db
 *
 * @brief shared handle to an SQLITE3 database.
 *
 * @desc Greenthreads get exclusive access through
 * `transact`, whose action provides a `Sqlite3::Tx` once
 * any earlier transaction has finished.
 */
class Db {
private:
	class Impl;
	std::shared_ptr<Impl> pimpl;

public:
	/* Used by the other Sqlite3 classes.  */
	void* get_connection() const;
	void transaction_finish();

	/* Opens a database, creating it if absent.
	 * ":memory:" gives an in-memory db.
	 * Throws std::runtime_error on failure.
	 */
	explicit
	Db(std::string const& filename);

	/* Creates an empty/invalid db object.  */
	Db() =default;
	Db(Db const&) =default;
	Db(Db&&) =default;
	Db& operator=(Db const&) =default;
	Db& operator=(Db&&) =default;
	~Db() =default;

	explicit
	operator bool() const { return !!pimpl; }
	bool operator!() const { return !pimpl; }

	Ev::Io<Sqlite3::Tx> transact();
};

}

#endif /* !defined(SQLITE3_DB_HPP) */
