#include"Ev/Io.hpp"
#include"Ev/now.hpp"
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include"Nostr/Relay.hpp"
#include"S/Bus.hpp"
#include"Util/make_unique.hpp"
#include"Zap/Mod/PaymentWatcher.hpp"
#include"Zap/Mod/Rpc.hpp"
#include"Zap/Mod/Waiter.hpp"
#include"Zap/Msg/Exit.hpp"
#include"Zap/Msg/Init.hpp"
#include"Zap/Msg/ProvideStatus.hpp"
#include"Zap/Msg/SolicitStatus.hpp"
#include"Zap/Msg/ZapSettings.hpp"
#include"Zap/Watcher.hpp"
#include"Zap/concurrent.hpp"
#include"Zap/log.hpp"

namespace Zap { namespace Mod {

class PaymentWatcher::Impl {
private:
	S::Bus& bus;
	Ev::ThreadPool& threadpool;
	Zap::Mod::Waiter& waiter;

	Zap::Mod::Rpc* rpc;
	std::unique_ptr<Zap::Msg::ZapSettings> settings;

	std::unique_ptr<Nostr::Relay> relay;
	std::unique_ptr<Zap::Watcher> watcher;

	Ev::Io<void> wait_for_both() {
		if (!rpc || !settings || watcher)
			return Ev::lift();

		relay = Util::make_unique<Nostr::Relay>( threadpool
						       , settings->relay_timeout
						       , settings->wait_ok
						       );
		auto w = Util::make_unique<Zap::Watcher>(
			bus, *settings, *relay,
			[this](std::uint64_t lastpay_index) {
				auto parms = Json::Out()
					.start_object()
						.field("lastpay_index", lastpay_index)
					.end_object()
					;
				return rpc->command("waitanyinvoice", parms);
			},
			[this](double seconds) {
				return waiter.wait(seconds);
			},
			&Ev::now
		);
		/* Throws Zap::CursorCorruption.  */
		w->load_cursor();
		watcher = std::move(w);

		return Zap::log( bus, Info
			       , "PaymentWatcher: waiting for invoices paid "
				 "after pay_index %llu."
			       , (unsigned long long) watcher->get_cursor()
			       ).then([this]() {
			return Zap::concurrent(run());
		});
	}

	/* The loop only ends on shutdown; anything else
	 * stops the plugin rather than leave it stalled.  */
	Ev::Io<void> run() {
		return watcher->run().catching<std::exception>([this](std::exception const& e) {
			auto reason = std::string(e.what());
			return Zap::log( bus, Error
				       , "PaymentWatcher: stopped: %s"
				       , reason.c_str()
				       ).then([this, reason]() {
				return bus.raise(Zap::Msg::Exit{1, reason});
			});
		});
	}

	Json::Out relays_status() const {
		auto js = Json::Out();
		auto arr = js.start_array();
		if (settings)
			for (auto const& r : settings->relays)
				arr.entry(r);
		arr.end_array();
		return js;
	}

public:
	Impl( S::Bus& bus_
	    , Ev::ThreadPool& threadpool_
	    , Zap::Mod::Waiter& waiter_
	    ) : bus(bus_)
	      , threadpool(threadpool_)
	      , waiter(waiter_)
	      , rpc(nullptr)
	      {
		bus.subscribe<Zap::Msg::Init>([this](Zap::Msg::Init const& init) {
			rpc = &init.rpc;
			return wait_for_both();
		});
		bus.subscribe<Zap::Msg::ZapSettings>([this](Zap::Msg::ZapSettings const& s) {
			settings = Util::make_unique<Zap::Msg::ZapSettings>(s);
			return wait_for_both();
		});
		bus.subscribe<Zap::Msg::SolicitStatus>([this](Zap::Msg::SolicitStatus const&) {
			if (!watcher)
				return Ev::lift();
			auto cursor = watcher->get_cursor();
			auto pending = watcher->pending_status();
			auto stuck = watcher->is_stuck();
			return bus.raise(Zap::Msg::ProvideStatus{
				"cursor", Json::Out::direct(std::to_string(cursor))
			}).then([this, pending]() {
				return bus.raise(Zap::Msg::ProvideStatus{
					"pending", pending
				});
			}).then([this, stuck]() {
				return bus.raise(Zap::Msg::ProvideStatus{
					"stuck", Json::Out::direct(stuck ? "true" : "false")
				});
			}).then([this]() {
				return bus.raise(Zap::Msg::ProvideStatus{
					"relays", relays_status()
				});
			});
		});
	}
};

PaymentWatcher::PaymentWatcher( S::Bus& bus
			      , Ev::ThreadPool& threadpool
			      , Zap::Mod::Waiter& waiter
			      ) : pimpl(Util::make_unique<Impl>(bus, threadpool, waiter))
				{ }
PaymentWatcher::PaymentWatcher(PaymentWatcher&&) =default;
PaymentWatcher::~PaymentWatcher() =default;

}}
