#include"Ev/Io.hpp"
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include"Nostr/Event.hpp"
#include"Nostr/RelayIF.hpp"
#include"S/Bus.hpp"
#include"Secp256k1/Random.hpp"
#include"Util/make_unique.hpp"
#include"Zap/CursorStore.hpp"
#include"Zap/Msg/PaymentHandled.hpp"
#include"Zap/Msg/ZapSettings.hpp"
#include"Zap/PaidInvoice.hpp"
#include"Zap/Publisher.hpp"
#include"Zap/RelaySet.hpp"
#include"Zap/Shutdown.hpp"
#include"Zap/Watcher.hpp"
#include"Zap/build_receipt.hpp"
#include"Zap/decide.hpp"
#include"Zap/extract_zap_request.hpp"
#include"Zap/log.hpp"
#include"Zap/validate_zap_request.hpp"
#include<algorithm>
#include<set>

namespace {

auto constexpr rpc_retry_delay = double(1.0);
auto constexpr max_hold_delay = double(60.0);

}

namespace Zap {

class Watcher::Impl {
private:
	S::Bus& bus;
	Zap::Msg::ZapSettings settings;
	std::function<Ev::Io<Jsmn::Object>(std::uint64_t)> wait_invoice;
	std::function<Ev::Io<void>(double)> sleep;
	std::function<double()> clock;

	Zap::CursorStore store;
	Zap::Publisher publisher;
	Secp256k1::Random random;

	std::uint64_t cursor;
	bool shutting_down;

	/* Kept while a payment is held.  */
	struct Pending {
		std::uint64_t pay_index;
		/* Empty id if signing failed.  */
		Nostr::Event receipt;
		std::string request_id;
		std::vector<RelayTarget> targets;
		std::set<std::string> accepted;
		std::size_t attempted;
		std::size_t failed_cycles;
	};
	std::unique_ptr<Pending> pending;

	/* Result of handling one payment.  */
	struct Handled {
		Outcome outcome;
		bool delivered;
		std::string request_id;
	};

	Ev::Io<std::shared_ptr<PaidInvoice>> fetch() {
		typedef std::shared_ptr<PaidInvoice> PInv;
		auto c = cursor;
		return Ev::lift().then([this, c]() {
			return wait_invoice(c);
		}).then([](Jsmn::Object result) {
			return Ev::lift(std::make_shared<PaidInvoice>(
				PaidInvoice::parse(result)
			));
		}).catching<std::runtime_error>([this](std::runtime_error const& e) {
			return Zap::log( bus, Warn
				       , "PaymentWatcher: waitanyinvoice: %s"
				       , e.what()
				       ).then([this]() {
				return sleep(rpc_retry_delay);
			}).then([]() {
				return Ev::lift(PInv());
			});
		});
	}

	Ev::Io<Handled> evaluate(std::shared_ptr<PaidInvoice> inv) {
		auto skip = [](Outcome o, std::string id) {
			return Ev::lift(Handled{o, false, std::move(id)});
		};

		if (!inv->is_paid())
			return Zap::log( bus, Debug
				       , "PaymentWatcher: invoice %llu status %s, "
					 "not a zap."
				       , (unsigned long long) inv->pay_index
				       , inv->status.c_str()
				       ).then([skip]() {
				return skip(NotAZap, "");
			});

		auto ex = std::make_shared<Extraction>(
			extract_zap_request(inv->description)
		);
		if (ex->kind != Extraction::Found)
			return Zap::log( bus, Debug
				       , "PaymentWatcher: invoice %llu (%s) "
					 "not a zap: %s"
				       , (unsigned long long) inv->pay_index
				       , inv->label.c_str()
				       , ex->reason.c_str()
				       ).then([skip]() {
				return skip(NotAZap, "");
			});

		auto v = validate_zap_request(ex->request, inv->amount);
		if (v.kind != Validation::Valid) {
			auto o = v.kind == Validation::AmountMismatch
			       ? AmountMismatch : InvalidRequest;
			return Zap::log( bus, Info
				       , "PaymentWatcher: invoice %llu zap "
					 "request %s rejected: %s"
				       , (unsigned long long) inv->pay_index
				       , ex->request.id.c_str()
				       , v.reason.c_str()
				       ).then([skip, o, ex]() {
				return skip(o, ex->request.id);
			});
		}

		/* No retry can produce a missing bolt11.  */
		if (inv->bolt11.empty())
			return Zap::log( bus, Info
				       , "PaymentWatcher: invoice %llu zap "
					 "request %s rejected: no bolt11"
				       , (unsigned long long) inv->pay_index
				       , ex->request.id.c_str()
				       ).then([skip, ex]() {
				return skip(InvalidRequest, ex->request.id);
			});

		if (!pending || pending->pay_index != inv->pay_index) {
			auto p = Util::make_unique<Pending>();
			p->pay_index = inv->pay_index;
			p->request_id = ex->request.id;
			p->targets = relay_targets(ex->request);
			p->attempted = 0;
			p->failed_cycles = 0;
			pending = std::move(p);
		}

		if (pending->receipt.id.empty()) {
			try {
				pending->receipt = build_receipt( ex->request
								, *inv
								, settings.key
								, random
								, std::uint64_t(clock())
								, settings.receipt_comment
								);
			} catch (SigningFailure const& e) {
				auto id = ex->request.id;
				return Zap::log( bus, Error
					       , "PaymentWatcher: invoice %llu: %s"
					       , (unsigned long long) inv->pay_index
					       , e.what()
					       ).then([id]() {
					return Ev::lift(Handled{Built, false, id});
				});
			}
		}

		return publish();
	}

	std::vector<RelayTarget> relay_targets(Nostr::Event const& request) {
		auto hints = std::vector<std::string>();
		if (settings.use_request_relays)
			for (auto const& t : request.tags_named("relays"))
				hints.insert(hints.end(), t.begin() + 1, t.end());
		return relay_set(settings.relays, hints);
	}

	Ev::Io<Handled> publish() {
		auto to_send = std::vector<RelayTarget>();
		for (auto const& t : pending->targets)
			if (pending->accepted.count(t.url) == 0)
				to_send.push_back(t);
		pending->attempted = std::max(pending->attempted, pending->targets.size());

		return publisher.publish( pending->receipt
					, std::move(to_send)
					).then([this](std::vector<RelayOutcome> outcomes) {
			auto act = Ev::lift();
			for (auto const& o : outcomes) {
				auto status = std::string();
				switch (o.result.status) {
				case Nostr::PublishResult::Accepted:
					status = "accepted";
					pending->accepted.insert(o.url);
					break;
				case Nostr::PublishResult::Rejected:
					status = "rejected";
					break;
				case Nostr::PublishResult::Transient:
					status = "failed";
					break;
				}
				act = act.then([this, o, status]() {
					return Zap::log( bus
						       , o.result.status == Nostr::PublishResult::Accepted ? Debug : Warn
						       , "PaymentWatcher: receipt %s %s by %s "
							 "after %zu attempt(s): %s"
						       , pending->receipt.id.c_str()
						       , status.c_str()
						       , o.url.c_str()
						       , o.attempts
						       , o.result.message.c_str()
						       );
				});
			}
			auto delivered = Publisher::satisfied( pending->targets
							     , pending->accepted
							     , settings.strict_relays
							     );
			auto id = pending->request_id;
			return act.then([delivered, id]() {
				return Ev::lift(Handled{Built, delivered, id});
			});
		});
	}

	Ev::Io<void> save_cursor(std::uint64_t index) {
		return Ev::lift().then([this, index]() {
			if (shutting_down)
				throw Zap::Shutdown();
			try {
				store.save(index);
			} catch (std::runtime_error const& e) {
				return Zap::log( bus, Error
					       , "PaymentWatcher: saving cursor "
						 "%llu: %s"
					       , (unsigned long long) index
					       , e.what()
					       ).then([this]() {
					return sleep(rpc_retry_delay);
				}).then([this, index]() {
					return save_cursor(index);
				});
			}
			cursor = index;
			return Ev::lift();
		});
	}

	Ev::Io<void> finish( std::shared_ptr<PaidInvoice> inv
			   , Handled h
			   ) {
		auto failed = std::size_t(0);
		if (h.outcome == Built && !h.delivered && pending)
			failed = ++pending->failed_cycles;
		auto step = decide( h.outcome, h.delivered
				  , failed, settings.give_up_cycles
				  );

		if (step == Hold)
			return hold(inv->pay_index, failed);

		auto msg = Zap::Msg::PaymentHandled();
		msg.pay_index = inv->pay_index;
		msg.outcome = h.outcome == Built
			    ? (step == GiveUp ? "given_up" : "published")
			    : outcome_name(h.outcome);
		msg.request_id = h.request_id;
		msg.accepted_relays = 0;
		msg.attempted_relays = 0;
		if (h.outcome == Built && pending) {
			msg.receipt_id = pending->receipt.id;
			msg.accepted_relays = pending->accepted.size();
			msg.attempted_relays = pending->attempted;
		}
		msg.timestamp = clock();

		auto act = Ev::lift();
		if (step == GiveUp)
			act = Zap::log( bus, Error
				      , "PaymentWatcher: giving up on invoice "
					"%llu after %zu failed cycles; its "
					"receipt was not delivered."
				      , (unsigned long long) inv->pay_index
				      , failed
				      );
		else if (h.outcome == Built)
			act = Zap::log( bus, Info
				      , "PaymentWatcher: published receipt %s "
					"for invoice %llu to %zu relay(s)."
				      , msg.receipt_id.c_str()
				      , (unsigned long long) inv->pay_index
				      , msg.accepted_relays
				      );

		return std::move(act).then([this, msg]() {
			return save_cursor(msg.pay_index);
		}).then([this, msg]() {
			pending = nullptr;
			return bus.raise(msg);
		});
	}

	Ev::Io<void> hold(std::uint64_t pay_index, std::size_t failed) {
		auto act = Zap::log( bus, Warn
				   , "PaymentWatcher: holding cursor at %llu; "
				     "invoice %llu not delivered (cycle %zu)."
				   , (unsigned long long) cursor
				   , (unsigned long long) pay_index
				   , failed
				   );
		if (failed == settings.stuck_alert_cycles)
			act = act.then([this, pay_index, failed]() {
				return Zap::log( bus, Error
					       , "PaymentWatcher: cursor stuck: "
						 "invoice %llu failed %zu cycles "
						 "in a row."
					       , (unsigned long long) pay_index
					       , failed
					       );
			});
		auto delay = std::min( max_hold_delay
				     , std::max(1.0, settings.publish_backoff)
				       * double(failed)
				     );
		return act.then([this, delay]() {
			return sleep(delay);
		});
	}

public:
	Impl( S::Bus& bus_
	    , Zap::Msg::ZapSettings const& settings_
	    , Nostr::RelayIF& relay
	    , std::function<Ev::Io<Jsmn::Object>(std::uint64_t)> wait_invoice_
	    , std::function<Ev::Io<void>(double)> sleep_
	    , std::function<double()> clock_
	    ) : bus(bus_)
	      , settings(settings_)
	      , wait_invoice(std::move(wait_invoice_))
	      , sleep(std::move(sleep_))
	      , clock(std::move(clock_))
	      , store(settings.cursor_path, settings.start_index)
	      , publisher( relay, sleep
			 , settings.publish_retries
			 , settings.publish_backoff
			 )
	      , cursor(settings.start_index)
	      , shutting_down(false)
	      {
		bus.subscribe<Zap::Shutdown>([this](Zap::Shutdown const&) {
			shutting_down = true;
			return Ev::lift();
		});
	}

	void load_cursor() {
		cursor = store.load();
	}

	Ev::Io<void> cycle() {
		return fetch().then([this](std::shared_ptr<PaidInvoice> inv) {
			if (!inv)
				return Ev::lift();
			if (inv->pay_index <= cursor)
				return Zap::log( bus, Warn
					       , "PaymentWatcher: node returned "
						 "invoice %llu, not after cursor "
						 "%llu."
					       , (unsigned long long) inv->pay_index
					       , (unsigned long long) cursor
					       ).then([this]() {
					return sleep(rpc_retry_delay);
				});
			return evaluate(inv).then([this, inv](Handled h) {
				return finish(inv, std::move(h));
			});
		});
	}

	Ev::Io<void> run() {
		return cycle().then([this]() {
			return run();
		});
	}

	std::uint64_t get_cursor() const { return cursor; }

	Json::Out pending_status() const {
		if (!pending)
			return Json::Out::direct("null");
		auto accepted = std::vector<std::string>( pending->accepted.begin()
							, pending->accepted.end()
							);
		return Json::Out()
			.start_object()
				.field("pay_index", pending->pay_index)
				.field("receipt_id", pending->receipt.id)
				.field("accepted_relays", accepted)
				.field("failed_cycles", pending->failed_cycles)
			.end_object()
			;
	}
	bool is_stuck() const {
		return pending
		    && settings.stuck_alert_cycles != 0
		    && pending->failed_cycles >= settings.stuck_alert_cycles
		     ;
	}
};

Watcher::Watcher( S::Bus& bus
		, Zap::Msg::ZapSettings const& settings
		, Nostr::RelayIF& relay
		, std::function<Ev::Io<Jsmn::Object>(std::uint64_t)> wait_invoice
		, std::function<Ev::Io<void>(double)> sleep
		, std::function<double()> clock
		) : pimpl(Util::make_unique<Impl>( bus, settings, relay
						 , std::move(wait_invoice)
						 , std::move(sleep)
						 , std::move(clock)
						 ))
		  { }
Watcher::Watcher(Watcher&&) =default;
Watcher::~Watcher() =default;

void Watcher::load_cursor() { pimpl->load_cursor(); }
Ev::Io<void> Watcher::run() { return pimpl->run(); }
Ev::Io<void> Watcher::cycle() { return pimpl->cycle(); }
std::uint64_t Watcher::get_cursor() const { return pimpl->get_cursor(); }
Json::Out Watcher::pending_status() const { return pimpl->pending_status(); }
bool Watcher::is_stuck() const { return pimpl->is_stuck(); }

}
