#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Sqlite3/Db.hpp"
#include"Sqlite3/Query.hpp"
#include"Sqlite3/Tx.hpp"
#include<assert.h>
#include<memory>
#include<stdexcept>

namespace {

Ev::Io<void> io_main() {
	auto db = std::make_shared<Sqlite3::Db>(":memory:");
	return db->transact().then([](Sqlite3::Tx tx) {
		tx.query_execute(R"SQL(
		CREATE TABLE Handled
		     ( pay_index INTEGER PRIMARY KEY
		     , outcome TEXT NOT NULL
		     , receipt_id TEXT
		     , time REAL NOT NULL
		     );
		)SQL");
		tx.query(R"SQL(
		INSERT INTO Handled VALUES(:i, :o, :r, :t);
		)SQL")
			.bind(":i", std::uint64_t(7))
			.bind(":o", std::string("published"))
			.bind(":r", std::string("abcd"))
			.bind(":t", 1.5)
			.execute()
			;
		tx.query(R"SQL(
		INSERT INTO Handled VALUES(:i, :o, :r, :t);
		)SQL")
			.bind(":i", 3)
			.bind(":o", std::string("not_a_zap"))
			.bind(":r", nullptr)
			.bind(":t", 0.5)
			.execute()
			;
		tx.commit();
		return Ev::lift();
	}).then([db]() {
		return db->transact();
	}).then([](Sqlite3::Tx tx) {
		auto res = tx.query(R"SQL(
		SELECT pay_index, outcome, receipt_id, time
		  FROM Handled
		 ORDER BY pay_index DESC;
		)SQL").execute();
		auto rows = 0;
		for (auto& r : res) {
			if (rows == 0) {
				assert(r.get_int(0) == 7);
				assert(r.get_string(1) == "published");
				assert(r.get_string(2) == "abcd");
				assert(r.get_double(3) == 1.5);
			} else {
				assert(r.get_int(0) == 3);
				assert(r.is_null(2));
			}
			++rows;
		}
		assert(rows == 2);
		tx.commit();
		return Ev::lift();
	}).then([db]() {
		/* Uncommitted transactions roll back.  */
		return db->transact().then([](Sqlite3::Tx tx) {
			tx.query_execute("DELETE FROM Handled;");
			return Ev::lift();
		});
	}).then([db]() {
		return db->transact();
	}).then([](Sqlite3::Tx tx) {
		auto count = std::int64_t(-1);
		for (auto& r : tx.query("SELECT COUNT(*) FROM Handled;").execute())
			count = r.get_int(0);
		assert(count == 2);

		/* Bad SQL is an exception.  */
		auto threw = false;
		try {
			tx.query_execute("SELEC nonsense;");
		} catch (std::runtime_error const&) {
			threw = true;
		}
		assert(threw);
		return Ev::lift();
	});
}

}

int main() {
	return Ev::start(io_main().then([]() {
		return Ev::lift(0);
	}));
}
