#include"Ev/Io.hpp"
#include"Json/Out.hpp"
#include"S/Bus.hpp"
#include"Sqlite3/Db.hpp"
#include"Sqlite3/Query.hpp"
#include"Sqlite3/Tx.hpp"
#include"Util/make_unique.hpp"
#include"Zap/Mod/ZapLedger.hpp"
#include"Zap/Msg/Init.hpp"
#include"Zap/Msg/PaymentHandled.hpp"
#include"Zap/Msg/ProvideStatus.hpp"
#include"Zap/Msg/SolicitStatus.hpp"
#include"Zap/log.hpp"
#include<stdexcept>

namespace {

auto constexpr recent_count = int(10);

}

namespace Zap { namespace Mod {

class ZapLedger::Impl {
private:
	S::Bus& bus;
	Sqlite3::Db db;

	Ev::Io<void> init() {
		return db.transact().then([](Sqlite3::Tx tx) {
			tx.query_execute(R"QRY(
			CREATE TABLE IF NOT EXISTS "ZapLedger"
			     ( pay_index INTEGER PRIMARY KEY
			     , outcome TEXT NOT NULL
			     , request_id TEXT NOT NULL
			     , receipt_id TEXT NOT NULL
			     , accepted_relays INTEGER NOT NULL
			     , attempted_relays INTEGER NOT NULL
			     , time REAL NOT NULL
			     );
			)QRY");
			tx.commit();
			return Ev::lift();
		});
	}

	Ev::Io<void> record(Zap::Msg::PaymentHandled const& p) {
		return db.transact().then([p](Sqlite3::Tx tx) {
			/* A payment handled again after a crash
			 * replaces its earlier row.  */
			tx.query(R"QRY(
			INSERT OR REPLACE INTO "ZapLedger"
			VALUES( :pay_index, :outcome, :request_id, :receipt_id
			      , :accepted, :attempted, :time
			      );
			)QRY")
				.bind(":pay_index", p.pay_index)
				.bind(":outcome", p.outcome)
				.bind(":request_id", p.request_id)
				.bind(":receipt_id", p.receipt_id)
				.bind(":accepted", std::uint64_t(p.accepted_relays))
				.bind(":attempted", std::uint64_t(p.attempted_relays))
				.bind(":time", p.timestamp)
				.execute()
				;
			tx.commit();
			return Ev::lift();
		}).catching<std::runtime_error>([this, p](std::runtime_error const& e) {
			return Zap::log( bus, Warn
				       , "ZapLedger: cannot record payment "
					 "%llu: %s"
				       , (unsigned long long) p.pay_index
				       , e.what()
				       );
		});
	}

	Ev::Io<void> status() {
		auto recent = std::make_shared<Json::Out>();
		return db.transact().then([recent](Sqlite3::Tx tx) {
			auto fetch = tx.query(R"QRY(
			SELECT pay_index, outcome, request_id, receipt_id
			     , accepted_relays, attempted_relays, time
			  FROM "ZapLedger"
			 ORDER BY pay_index DESC
			 LIMIT :count;
			)QRY")
				.bind(":count", recent_count)
				.execute()
				;
			auto arr = recent->start_array();
			for (auto& r : fetch) {
				arr.start_object()
					.field("pay_index", r.get_int(0))
					.field("outcome", r.get_string(1))
					.field("request_id", r.get_string(2))
					.field("receipt_id", r.get_string(3))
					.field("accepted_relays", r.get_int(4))
					.field("attempted_relays", r.get_int(5))
					.field("time", r.get_double(6))
				.end_object();
			}
			arr.end_array();
			tx.commit();
			return Ev::lift();
		}).then([this, recent]() {
			return bus.raise(Zap::Msg::ProvideStatus{
				"recent", *recent
			});
		}).catching<std::runtime_error>([this](std::runtime_error const& e) {
			return Zap::log( bus, Warn
				       , "ZapLedger: cannot read ledger: %s"
				       , e.what()
				       );
		});
	}

public:
	explicit
	Impl(S::Bus& bus_) : bus(bus_) {
		bus.subscribe<Zap::Msg::Init>([this](Zap::Msg::Init const& init) {
			db = init.db;
			return this->init();
		});
		bus.subscribe<Zap::Msg::PaymentHandled>([this](Zap::Msg::PaymentHandled const& p) {
			if (!db)
				return Ev::lift();
			return record(p);
		});
		bus.subscribe<Zap::Msg::SolicitStatus>([this](Zap::Msg::SolicitStatus const&) {
			if (!db)
				return Ev::lift();
			return status();
		});
	}
};

ZapLedger::ZapLedger(S::Bus& bus) : pimpl(Util::make_unique<Impl>(bus)) { }
ZapLedger::ZapLedger(ZapLedger&&) =default;
ZapLedger::~ZapLedger() =default;

}}
