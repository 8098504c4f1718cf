#include"Sqlite3/Db.hpp"
#include"Sqlite3/Query.hpp"
#include"Util/BacktraceException.hpp"
#include"Util/make_unique.hpp"
#include<sqlite3.h>
#include<stdexcept>

namespace {

void check_bind(int res, char const* field) {
	if (res != SQLITE_OK)
		throw Util::BacktraceException<std::runtime_error>(
			std::string("Sqlite3::Query::bind: ") + field + ": " +
			sqlite3_errstr(res)
		);
}

}

namespace Sqlite3 {

class Query::Impl {
public:
	Db db;
	sqlite3_stmt* stmt;

	Impl(Db const& db_, void* stmt_)
		: db(db_), stmt((sqlite3_stmt*) stmt_) { }
	~Impl() {
		if (stmt)
			sqlite3_finalize(stmt);
	}

	int location(char const* field) const {
		auto res = sqlite3_bind_parameter_index(stmt, field);
		if (res == 0)
			throw Util::BacktraceException<std::runtime_error>(
				std::string("Sqlite3::Query::bind: no field: ") +
				field
			);
		return res;
	}
};

Query::Query(Sqlite3::Db const& db, void* stmt)
	: pimpl(Util::make_unique<Impl>(db, stmt)) { }
Query::Query(Query&& o) : pimpl(std::move(o.pimpl)) { }
Query::~Query() { }

Query& Query::bind(char const* field, std::int64_t value) {
	check_bind( sqlite3_bind_int64(pimpl->stmt, pimpl->location(field), value)
		  , field
		  );
	return *this;
}
Query& Query::bind(char const* field, double value) {
	check_bind( sqlite3_bind_double(pimpl->stmt, pimpl->location(field), value)
		  , field
		  );
	return *this;
}
Query& Query::bind(char const* field, std::string const& value) {
	check_bind( sqlite3_bind_text( pimpl->stmt, pimpl->location(field)
				     , value.c_str(), int(value.size())
				     , SQLITE_TRANSIENT
				     )
		  , field
		  );
	return *this;
}
Query& Query::bind(char const* field, std::nullptr_t) {
	check_bind( sqlite3_bind_null(pimpl->stmt, pimpl->location(field))
		  , field
		  );
	return *this;
}

Result Query::execute() {
	auto impl = std::move(pimpl);
	auto stmt = impl->stmt;
	impl->stmt = nullptr;
	return Result(impl->db, stmt);
}

std::int64_t Row::get_int(int c) const {
	return sqlite3_column_int64((sqlite3_stmt*) r->stmt, c);
}
double Row::get_double(int c) const {
	return sqlite3_column_double((sqlite3_stmt*) r->stmt, c);
}
std::string Row::get_string(int c) const {
	auto stmt = (sqlite3_stmt*) r->stmt;
	auto p = sqlite3_column_text(stmt, c);
	if (!p)
		return "";
	return std::string( (char const*) p
			  , std::size_t(sqlite3_column_bytes(stmt, c))
			  );
}
bool Row::is_null(int c) const {
	return sqlite3_column_type((sqlite3_stmt*) r->stmt, c) == SQLITE_NULL;
}

Result::Result(Sqlite3::Db const& db_, void* stmt_)
	: db(db_), stmt(stmt_) {
	advance();
}
Result::Result(Result&& o) : db(std::move(o.db)), stmt(o.stmt) {
	o.stmt = nullptr;
}
Result::~Result() {
	if (stmt)
		sqlite3_finalize((sqlite3_stmt*) stmt);
}

bool Result::advance() {
	auto res = sqlite3_step((sqlite3_stmt*) stmt);
	if (res == SQLITE_ROW)
		return true;
	sqlite3_finalize((sqlite3_stmt*) stmt);
	stmt = nullptr;
	if (res == SQLITE_DONE)
		return false;
	auto conn = (sqlite3*) db.get_connection();
	throw Util::BacktraceException<std::runtime_error>(
		std::string("Sqlite3::Result: ") + sqlite3_errmsg(conn)
	);
}

}
