#include"Ev/Io.hpp"
#include"Ev/map.hpp"
#include"Nostr/Event.hpp"
#include"Zap/Publisher.hpp"

namespace Zap {

Ev::Io<RelayOutcome>
Publisher::attempt( std::shared_ptr<Nostr::Event const> ev
		  , RelayTarget target
		  , std::size_t attempts
		  , double delay
		  ) {
	return relay.publish(target.url, *ev).then([ this
						   , ev
						   , target
						   , attempts
						   , delay
						   ](Nostr::PublishResult r) {
		if ( r.status != Nostr::PublishResult::Transient
		  || attempts > retries
		   )
			return Ev::lift(RelayOutcome{
				target.url, target.configured,
				std::move(r), attempts
			});
		return sleep(delay).then([this, ev, target, attempts, delay]() {
			return attempt(ev, target, attempts + 1, delay * 2);
		});
	});
}

Ev::Io<std::vector<RelayOutcome>>
Publisher::publish( Nostr::Event const& event
		  , std::vector<RelayTarget> targets
		  ) {
	auto ev = std::make_shared<Nostr::Event const>(event);
	return Ev::map([this, ev](RelayTarget t) {
		return attempt(ev, std::move(t), 1, backoff);
	}, std::move(targets));
}

bool Publisher::satisfied( std::vector<RelayTarget> const& targets
			 , std::set<std::string> const& accepted
			 , bool strict
			 ) {
	if (accepted.empty())
		return false;
	if (!strict)
		return true;
	for (auto const& t : targets)
		if (t.configured && accepted.count(t.url) == 0)
			return false;
	return true;
}

}
