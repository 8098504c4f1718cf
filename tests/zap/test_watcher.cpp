#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include"Nostr/Event.hpp"
#include"Nostr/RelayIF.hpp"
#include"S/Bus.hpp"
#include"Secp256k1/PrivKey.hpp"
#include"Sha256/Hash.hpp"
#include"Sha256/fun.hpp"
#include"Util/make_unique.hpp"
#include"Zap/CursorStore.hpp"
#include"Zap/Msg/PaymentHandled.hpp"
#include"Zap/Msg/ZapSettings.hpp"
#include"Zap/Watcher.hpp"
#include"zap/vectors.hpp"
#include<assert.h>
#include<deque>
#include<map>
#include<memory>
#include<cstdio>
#include<stdexcept>
#include<stdlib.h>
#include<unistd.h>
#include<vector>

namespace {

using Nostr::PublishResult;

class FakeRelay : public Nostr::RelayIF {
public:
	/* Answer per relay for the next publish; the last
	 * one repeats.  */
	std::map<std::string, std::deque<PublishResult::Status>> script;
	std::vector<std::pair<std::string, std::string>> sent;
	std::vector<Nostr::Event> events;

	Ev::Io<PublishResult> publish( std::string const& url
				     , Nostr::Event const& event
				     ) override {
		assert(event.verify());
		sent.emplace_back(url, event.id);
		events.push_back(event);
		auto& q = script[url];
		assert(!q.empty());
		auto s = q.front();
		if (q.size() > 1)
			q.pop_front();
		return Ev::lift(PublishResult{s, ""});
	}
};

/* Hands out the queued `waitanyinvoice` results.  */
class FakeNode {
public:
	std::deque<std::string> invoices;
	std::vector<std::uint64_t> asked;

	Ev::Io<Jsmn::Object> wait(std::uint64_t lastpay_index) {
		asked.push_back(lastpay_index);
		assert(!invoices.empty());
		auto text = invoices.front();
		invoices.pop_front();
		return Ev::yield().then([text]() {
			if (text == "fail")
				throw std::runtime_error("lightningd went away");
			return Ev::lift(Jsmn::Object::parse_json(text));
		});
	}
};

std::string invoice( std::uint64_t pay_index
		   , std::string const& description
		   , std::uint64_t msat
		   , bool with_bolt11 = true
		   ) {
	auto js = Json::Out();
	auto obj = js.start_object();
	obj
		.field("label", std::string(Vectors::label))
		.field("description", description)
		.field("status", std::string("paid"))
		.field("pay_index", pay_index)
		.field("amount_msat", msat)
		.field("amount_received_msat", msat)
		;
	if (with_bolt11)
		obj.field("bolt11", std::string(Vectors::bolt11));
	obj.end_object();
	return js.output();
}

/* The zap request with one signature nibble flipped.  */
std::string forged_zap() {
	auto ev = Nostr::Event::parse(
		Jsmn::Object::parse_json(std::string(Vectors::zap_request))
	);
	auto& c = ev.sig.back();
	c = (c == '0') ? '1' : '0';
	return ev.to_json();
}

struct Harness {
	S::Bus bus;
	FakeRelay relay;
	FakeNode node;
	std::vector<double> sleeps;
	std::vector<Zap::Msg::PaymentHandled> handled;
	std::unique_ptr<Zap::Watcher> watcher;

	Harness(Zap::Msg::ZapSettings const& settings) {
		bus.subscribe<Zap::Msg::PaymentHandled>([this](Zap::Msg::PaymentHandled const& m) {
			handled.push_back(m);
			return Ev::lift();
		});
		watcher = Util::make_unique<Zap::Watcher>(
			bus, settings, relay,
			[this](std::uint64_t i) { return node.wait(i); },
			[this](double d) {
				sleeps.push_back(d);
				return Ev::lift();
			},
			[]() { return 1700000000.0; }
		);
		watcher->load_cursor();
	}

	/* Runs `n` cycles.  */
	void cycles(int n) {
		auto act = Ev::lift();
		for (auto i = 0; i < n; ++i)
			act = act.then([this]() {
				return watcher->cycle();
			});
		auto rc = Ev::start(act.then([]() {
			return Ev::lift(0);
		}));
		assert(rc == 0);
	}
};

Zap::Msg::ZapSettings
make_settings(std::string const& cursor_path) {
	return Zap::Msg::ZapSettings{
		Secp256k1::PrivKey(std::string(Vectors::secret_key)),
		{"wss://a", "wss://b"},
		0,
		cursor_path,
		0,
		1.0,
		10.0,
		false,
		true,
		"",
		false,
		2,
		0
	};
}

std::string const zap = Vectors::zap_request;

}

int main() {
	char tmpl[] = "/tmp/clzap-test-watcher-XXXXXX";
	auto dir = std::string(mkdtemp(tmpl));

	{
		auto path = dir + "/best-effort";
		auto h = Harness(make_settings(path));
		assert(h.watcher->get_cursor() == 0);

		/* Not a zap: the cursor moves on.  */
		h.node.invoices.push_back(invoice(1, "coffee", 1000));
		h.cycles(1);
		assert(h.node.asked == std::vector<std::uint64_t>{0});
		assert(h.watcher->get_cursor() == 1);
		assert(Zap::CursorStore(path, 0).load() == 1);
		assert(h.handled.size() == 1);
		assert(h.handled[0].outcome == "not_a_zap");
		assert(h.relay.sent.empty());

		/* A zap no relay takes: the cursor holds.  */
		h.relay.script["wss://a"] = {PublishResult::Transient, PublishResult::Accepted};
		h.relay.script["wss://b"] = {PublishResult::Transient};
		h.node.invoices.push_back(invoice(2, zap, 50000));
		h.cycles(1);
		assert(h.watcher->get_cursor() == 1);
		assert(Zap::CursorStore(path, 0).load() == 1);
		assert(h.handled.size() == 1);
		assert(h.relay.sent.size() == 2);
		assert(h.sleeps.size() == 1);
		assert(!h.watcher->is_stuck());
		auto pending = Jsmn::Object::parse_json(h.watcher->pending_status().output());
		assert(double(pending["pay_index"]) == 2);
		assert(double(pending["failed_cycles"]) == 1);
		assert(pending["accepted_relays"].size() == 0);

		/* Node gives the same payment again; one relay
		 * takes it now and the same receipt is sent.  */
		h.node.invoices.push_back(invoice(2, zap, 50000));
		h.cycles(1);
		assert(h.node.asked == (std::vector<std::uint64_t>{0, 1, 1}));
		assert(h.watcher->get_cursor() == 2);
		assert(Zap::CursorStore(path, 0).load() == 2);
		assert(h.relay.sent.size() == 4);
		assert(h.relay.sent[0].second == h.relay.sent[3].second);
		assert(h.handled.size() == 2);
		assert(h.handled[1].outcome == "published");
		assert(h.handled[1].request_id == Vectors::zap_request_id);
		assert(h.handled[1].receipt_id == h.relay.sent[0].second);
		assert(h.handled[1].accepted_relays == 1);
		assert(h.handled[1].attempted_relays == 2);
		assert(h.watcher->pending_status().output() == "null");

		/* Paid less than the request says.  */
		h.node.invoices.push_back(invoice(3, zap, 5000));
		h.cycles(1);
		assert(h.watcher->get_cursor() == 3);
		assert(h.handled.back().outcome == "amount_mismatch");
		assert(h.relay.sent.size() == 4);

		/* Failing RPC and stale indices leave the cursor
		 * alone.  */
		h.node.invoices.push_back("fail");
		h.node.invoices.push_back(invoice(3, "coffee", 1));
		h.node.invoices.push_back("{\"status\":\"paid\"}");
		auto sleeps = h.sleeps.size();
		h.cycles(3);
		assert(h.watcher->get_cursor() == 3);
		assert(h.sleeps.size() == sleeps + 3);
		assert(h.handled.size() == 3);

		/* A forged signature is never published.  */
		h.node.invoices.push_back(invoice(4, forged_zap(), 50000));
		h.cycles(1);
		assert(h.watcher->get_cursor() == 4);
		assert(Zap::CursorStore(path, 0).load() == 4);
		assert(h.handled.back().outcome == "invalid_request");
		assert(h.relay.sent.size() == 4);

		/* No bolt11 to put in a receipt: skipped at once,
		 * not held.  */
		sleeps = h.sleeps.size();
		h.node.invoices.push_back(invoice(5, zap, 50000, false));
		h.cycles(1);
		assert(h.watcher->get_cursor() == 5);
		assert(Zap::CursorStore(path, 0).load() == 5);
		assert(h.handled.back().outcome == "invalid_request");
		assert(h.handled.back().request_id == Vectors::zap_request_id);
		assert(h.relay.sent.size() == 4);
		assert(h.sleeps.size() == sleeps);
		assert(h.watcher->pending_status().output() == "null");

		/* The receipt carries the description exactly as
		 * the invoice has it, padding included.  */
		auto padded = "\n  " + zap + " \n";
		h.node.invoices.push_back(invoice(6, padded, 50000));
		h.cycles(1);
		assert(h.watcher->get_cursor() == 6);
		assert(h.handled.back().outcome == "published");
		assert(h.relay.events.size() == 6);
		auto desc = h.relay.events.back().tags_named("description");
		assert(desc.size() == 1);
		assert(desc[0][1] == padded);
		assert(Sha256::fun(desc[0][1]) == Sha256::fun(padded));

		unlink(path.c_str());
	}

	{
		/* Three relays, two unreachable: best-effort moves
		 * on with the one that accepted.  */
		auto path = dir + "/three";
		auto settings = make_settings(path);
		settings.relays = {"wss://a", "wss://b", "wss://c"};
		auto h = Harness(settings);
		h.relay.script["wss://a"] = {PublishResult::Transient};
		h.relay.script["wss://b"] = {PublishResult::Transient};
		h.relay.script["wss://c"] = {PublishResult::Accepted};
		h.node.invoices.push_back(invoice(1, zap, 50000));
		h.cycles(1);
		assert(h.watcher->get_cursor() == 1);
		assert(h.handled.size() == 1);
		assert(h.handled[0].outcome == "published");
		assert(h.handled[0].accepted_relays == 1);
		assert(h.handled[0].attempted_relays == 3);
		unlink(path.c_str());
	}

	{
		/* The same in strict mode holds the cursor.  */
		auto path = dir + "/three-strict";
		auto settings = make_settings(path);
		settings.relays = {"wss://a", "wss://b", "wss://c"};
		settings.strict_relays = true;
		auto h = Harness(settings);
		h.relay.script["wss://a"] = {PublishResult::Transient};
		h.relay.script["wss://b"] = {PublishResult::Transient};
		h.relay.script["wss://c"] = {PublishResult::Accepted};
		h.node.invoices.push_back(invoice(1, zap, 50000));
		h.cycles(1);
		assert(h.watcher->get_cursor() == 0);
		assert(h.handled.empty());
		auto pending = Jsmn::Object::parse_json(h.watcher->pending_status().output());
		assert(pending["accepted_relays"].size() == 1);
		assert(std::string(pending["accepted_relays"][std::size_t(0)]) == "wss://c");
		unlink(path.c_str());
	}

	{
		/* Restart picks up the persisted cursor.  */
		auto path = dir + "/restart";
		Zap::CursorStore(path, 0).save(41);
		auto h = Harness(make_settings(path));
		assert(h.watcher->get_cursor() == 41);
		h.node.invoices.push_back(invoice(42, "", 1));
		h.cycles(1);
		assert(h.node.asked == std::vector<std::uint64_t>{41});
		assert(h.watcher->get_cursor() == 42);
		unlink(path.c_str());
	}

	{
		/* Strict: every configured relay must accept; only
		 * the missing ones are retried.  */
		auto path = dir + "/strict";
		auto settings = make_settings(path);
		settings.strict_relays = true;
		auto h = Harness(settings);
		h.relay.script["wss://a"] = {PublishResult::Accepted};
		h.relay.script["wss://b"] = {PublishResult::Rejected, PublishResult::Rejected, PublishResult::Accepted};

		for (auto i = 0; i < 3; ++i)
			h.node.invoices.push_back(invoice(1, zap, 50000));
		h.cycles(2);
		assert(h.watcher->get_cursor() == 0);
		assert(h.watcher->is_stuck());
		/* a once, b twice.  */
		assert(h.relay.sent.size() == 3);
		/* Hold delay grows with failed cycles.  */
		assert((h.sleeps == std::vector<double>{1.0, 2.0}));

		h.cycles(1);
		assert(h.watcher->get_cursor() == 1);
		assert(h.relay.sent.size() == 4);
		assert(h.relay.sent[3].first == "wss://b");
		assert(h.handled.back().outcome == "published");
		assert(h.handled.back().accepted_relays == 2);
		assert(!h.watcher->is_stuck());
		unlink(path.c_str());
	}

	{
		/* Giving up after too many cycles.  */
		auto path = dir + "/giveup";
		auto settings = make_settings(path);
		settings.give_up_cycles = 2;
		auto h = Harness(settings);
		h.relay.script["wss://a"] = {PublishResult::Rejected};
		h.relay.script["wss://b"] = {PublishResult::Transient};
		h.node.invoices.push_back(invoice(7, zap, 50000));
		h.node.invoices.push_back(invoice(7, zap, 50000));
		h.cycles(1);
		assert(h.watcher->get_cursor() == 0);
		h.cycles(1);
		assert(h.watcher->get_cursor() == 7);
		assert(Zap::CursorStore(path, 0).load() == 7);
		assert(h.handled.size() == 1);
		assert(h.handled[0].outcome == "given_up");
		assert(h.handled[0].accepted_relays == 0);
		unlink(path.c_str());
	}

	{
		/* A corrupt cursor stops the watcher from starting.  */
		auto path = dir + "/corrupt";
		{
			auto fd = fopen(path.c_str(), "w");
			fputs("garbage", fd);
			fclose(fd);
		}
		auto threw = false;
		try {
			auto h = Harness(make_settings(path));
		} catch (Zap::CursorCorruption const&) {
			threw = true;
		}
		assert(threw);
		unlink(path.c_str());
	}

	rmdir(dir.c_str());
	return 0;
}
