#ifndef SQLITE3_QUERY_HPP
#define SQLITE3_QUERY_HPP

#include"Sqlite3/Db.hpp"
#include<cstddef>
#include<cstdint>
#include<iterator>
#include<memory>
#include<string>

namespace Sqlite3 { class Result; }
namespace Sqlite3 { class Tx; }

namespace Sqlite3 {

/** class Sqlite3::Query
 *
 * @brief a prepared statement waiting for its named
 * parameters (`:name`) to be bound before `execute`.
 */
class Query {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

	friend class Sqlite3::Tx;
	Query(Sqlite3::Db const&, void*);

public:
	Query() =delete;
	Query(Query&&);
	~Query();

	/* Throws std::runtime_error on an unknown name.  */
	Query& bind(char const* field, std::int64_t value);
	Query& bind(char const* field, std::uint64_t value) {
		return bind(field, std::int64_t(value));
	}
	Query& bind(char const* field, int value) {
		return bind(field, std::int64_t(value));
	}
	Query& bind(char const* field, double value);
	Query& bind(char const* field, std::string const& value);
	Query& bind(char const* field, std::nullptr_t);

	/* Post-condition: this query is spent.  */
	Result execute();
};

/** class Sqlite3::Row
 *
 * @brief the current row of a result.
 */
class Row {
private:
	Result* r;

public:
	explicit
	Row(Result* r_) : r(r_) { }
	Row(Row const&) =delete;

	std::int64_t get_int(int c) const;
	double get_double(int c) const;
	std::string get_string(int c) const;
	bool is_null(int c) const;
};

/** class Sqlite3::Result
 *
 * @brief the rows a query produced.
 *
 * @desc A result can be traversed exactly once.
 * Statements without rows (INSERT, UPDATE) complete
 * when the Result is constructed.
 */
class Result {
private:
	Sqlite3::Db db;
	void* stmt;

	friend class Sqlite3::Query;
	friend class Sqlite3::Row;

	Result(Sqlite3::Db const& db_, void* stmt_);

	/* Return false at end of result.  */
	bool advance();

public:
	Result() =delete;
	Result(Result const&) =delete;
	Result(Result&&);
	~Result();

	class iterator {
	private:
		Result* r;
		Row row;

		friend class Sqlite3::Result;
		explicit
		iterator(Result* r_) : r(r_), row(r_) { }

	public:
		typedef std::input_iterator_tag iterator_category;
		typedef Row value_type;
		typedef std::ptrdiff_t difference_type;
		typedef Row const* pointer;
		typedef Row const& reference;

		iterator(iterator const& o) : r(o.r), row(o.r) { }

		bool operator==(iterator const& o) const { return r == o.r; }
		bool operator!=(iterator const& o) const { return r != o.r; }

		iterator& operator++() {
			if (r && !r->advance())
				r = nullptr;
			return *this;
		}
		Row const& operator*() const { return row; }
	};
	iterator begin() {
		return iterator(stmt ? this : nullptr);
	}
	iterator end() {
		return iterator(nullptr);
	}
};

}

#endif /* !defined(SQLITE3_QUERY_HPP) */
