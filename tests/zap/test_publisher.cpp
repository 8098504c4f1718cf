#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include"Nostr/Event.hpp"
#include"Nostr/RelayIF.hpp"
#include"Zap/Publisher.hpp"
#include<assert.h>
#include<deque>
#include<map>
#include<memory>
#include<vector>

namespace {

using Nostr::PublishResult;

/* Answers from a script per relay; the last answer
 * repeats.  */
class FakeRelay : public Nostr::RelayIF {
public:
	std::map<std::string, std::deque<PublishResult>> script;
	std::map<std::string, std::size_t> calls;

	Ev::Io<PublishResult> publish( std::string const& url
				     , Nostr::Event const& event
				     ) override {
		++calls[url];
		auto& q = script[url];
		assert(!q.empty());
		auto r = q.front();
		if (q.size() > 1)
			q.pop_front();
		return Ev::yield().then([r]() {
			return Ev::lift(r);
		});
	}
};

PublishResult accepted() { return PublishResult{PublishResult::Accepted, ""}; }
PublishResult rejected() { return PublishResult{PublishResult::Rejected, "blocked: no"}; }
PublishResult transient() { return PublishResult{PublishResult::Transient, "timed out"}; }

}

int main() {
	auto relay = FakeRelay();
	auto delays = std::make_shared<std::vector<double>>();
	auto sleep = [delays](double d) {
		delays->push_back(d);
		return Ev::lift();
	};
	auto publisher = Zap::Publisher(relay, sleep, 3, 1.0);

	auto ev = Nostr::Event();
	ev.id = std::string(64, 'a');
	ev.kind = 9735;

	relay.script["wss://ok"] = {accepted()};
	relay.script["wss://down"] = {transient()};
	relay.script["wss://no"] = {rejected()};
	relay.script["wss://flaky"] = {transient(), transient(), accepted()};

	auto targets = std::vector<Zap::RelayTarget>{
		{"wss://ok", true},
		{"wss://down", true},
		{"wss://no", false},
		{"wss://flaky", false}
	};

	auto code = publisher.publish(ev, targets).then([&](std::vector<Zap::RelayOutcome> os) {
		assert(os.size() == 4);

		assert(os[0].url == "wss://ok");
		assert(os[0].result.status == PublishResult::Accepted);
		assert(os[0].attempts == 1);

		/* One attempt plus three retries.  */
		assert(os[1].url == "wss://down");
		assert(os[1].result.status == PublishResult::Transient);
		assert(os[1].attempts == 4);
		assert(relay.calls["wss://down"] == 4);

		/* Rejections are not retried.  */
		assert(os[2].result.status == PublishResult::Rejected);
		assert(!os[2].configured);
		assert(os[2].attempts == 1);

		assert(os[3].result.status == PublishResult::Accepted);
		assert(os[3].attempts == 3);

		/* Backoff doubles per relay: 1 2 4 for the dead
		 * relay, 1 2 for the flaky one.  */
		auto total = 0.0;
		for (auto d : *delays)
			total += d;
		assert(delays->size() == 5);
		assert(total == 10.0);

		return publisher.publish(ev, {});
	}).then([](std::vector<Zap::RelayOutcome> os) {
		assert(os.empty());
		return Ev::lift(0);
	});
	auto rc = Ev::start(code);
	assert(rc == 0);

	{
		using Zap::Publisher;
		auto targets = std::vector<Zap::RelayTarget>{
			{"wss://a", true},
			{"wss://b", true},
			{"wss://hint", false}
		};
		assert(!Publisher::satisfied(targets, {}, false));
		assert(!Publisher::satisfied(targets, {}, true));
		assert(Publisher::satisfied(targets, {"wss://hint"}, false));
		assert(!Publisher::satisfied(targets, {"wss://hint"}, true));
		assert(!Publisher::satisfied(targets, {"wss://a", "wss://hint"}, true));
		/* Hints do not count against strict mode.  */
		assert(Publisher::satisfied(targets, {"wss://a", "wss://b"}, true));
	}

	return 0;
}
