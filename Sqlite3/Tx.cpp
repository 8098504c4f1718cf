#include"Sqlite3/Db.hpp"
#include"Sqlite3/Query.hpp"
#include"Sqlite3/Tx.hpp"
#include"Util/BacktraceException.hpp"
#include"Util/make_unique.hpp"
#include<sqlite3.h>
#include<stdexcept>

namespace Sqlite3 {

class Tx::Impl {
private:
	Sqlite3::Db db;
	bool finished;

	sqlite3* connection() const {
		return (sqlite3*) db.get_connection();
	}

	void exec(char const* sql) {
		if (sqlite3_exec(connection(), sql, nullptr, nullptr, nullptr) != SQLITE_OK)
			throw Util::BacktraceException<std::runtime_error>(
				std::string("Sqlite3::Tx: ") + sql + ": " +
				sqlite3_errmsg(connection())
			);
	}

public:
	explicit
	Impl(Sqlite3::Db const& db_) : db(db_), finished(false) {
		exec("BEGIN");
	}
	~Impl() {
		if (!finished)
			/* Nowhere to report a failure from here.  */
			sqlite3_exec(connection(), "ROLLBACK", nullptr, nullptr, nullptr);
		db.transaction_finish();
	}

	void end(char const* sql) {
		finished = true;
		exec(sql);
	}

	void query_execute(char const* q) {
		exec(q);
	}

	Sqlite3::Db const& get_db() const { return db; }

	sqlite3_stmt* prepare(char const* sql) {
		auto stmt = (sqlite3_stmt*) nullptr;
		auto res = sqlite3_prepare_v2(connection(), sql, -1, &stmt, nullptr);
		if (res != SQLITE_OK)
			throw Util::BacktraceException<std::runtime_error>(
				std::string("Sqlite3::Tx: prepare: ") + sql + ": " +
				sqlite3_errmsg(connection())
			);
		return stmt;
	}
};

Tx::Tx(Sqlite3::Db const& db) : pimpl(Util::make_unique<Impl>(db)) { }
Tx::Tx() : pimpl(nullptr) { }
Tx::Tx(Tx&& o) : pimpl(std::move(o.pimpl)) { }
Tx::~Tx() { }

Tx& Tx::operator=(Tx&& o) {
	auto tmp = std::move(o);
	std::swap(pimpl, tmp.pimpl);
	return *this;
}

void Tx::commit() {
	auto impl = std::move(pimpl);
	impl->end("COMMIT");
}
void Tx::rollback() {
	auto impl = std::move(pimpl);
	impl->end("ROLLBACK");
}

Query Tx::query(char const* sql) {
	auto stmt = pimpl->prepare(sql);
	return Query(pimpl->get_db(), stmt);
}
void Tx::query_execute(char const* q) {
	pimpl->query_execute(q);
}

}
