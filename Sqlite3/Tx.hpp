#ifndef SQLITE3_TX_HPP
#define SQLITE3_TX_HPP

#include"Sqlite3/Query.hpp"
#include<memory>
#include<string>

namespace Sqlite3 { class Db; }

namespace Sqlite3 {

/** class Sqlite3::Tx
 *
 * @brief an ongoing database transaction.
 *
 * @desc Movable, not copyable.  A valid transaction that
 * is destroyed without `commit()` is rolled back, so an
 * exception thrown mid-transaction leaves the db as it
 * was.
 */
class Tx {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	/* Begins a transaction immediately; use
	 * Sqlite3::Db::transact instead.  */
	explicit
	Tx(Sqlite3::Db const&);
	/* Invalid transaction, only useful as a placeholder.  */
	Tx();
	Tx(Tx&&);
	~Tx();

	Tx& operator=(Tx&&);

	explicit
	operator bool() const { return !!pimpl; }
	bool operator!() const { return !pimpl; }

	Sqlite3::Query query(char const*);
	Sqlite3::Query query(std::string const& q) {
		return query(q.c_str());
	}

	/* Runs statements with no parameters or results,
	 * e.g. table creation.  */
	void query_execute(char const*);
	void query_execute(std::string const& q) {
		query_execute(q.c_str());
	}

	/* Pre-condition: the transaction is valid.
	 * Post-condition: the transaction is invalid.
	 */
	void commit();
	void rollback();
};

}

#endif /* !defined(SQLITE3_TX_HPP) */
