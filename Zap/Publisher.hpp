#ifndef ZAP_PUBLISHER_HPP
#define ZAP_PUBLISHER_HPP

#include"Nostr/RelayIF.hpp"
#include"Zap/RelaySet.hpp"
#include<cstddef>
#include<functional>
#include<memory>
#include<set>
#include<string>
#include<vector>

namespace Ev { template<typename a> class Io; }
namespace Nostr { struct Event; }

namespace Zap {

struct RelayOutcome {
	std::string url;
	bool configured;
	Nostr::PublishResult result;
	std::size_t attempts;
};

/** class Zap::Publisher
 *
 * @brief sends one event to a set of relays, all at
 * once, retrying transient failures per relay.
 *
 * @desc A relay that reports Transient is tried again
 * after `backoff` seconds, then twice that, and so on,
 * for at most `retries` extra attempts.  Rejections are
 * final.  The returned action completes once every
 * relay has a final outcome.
 */
class Publisher {
private:
	Nostr::RelayIF& relay;
	std::function<Ev::Io<void>(double)> sleep;
	std::size_t retries;
	double backoff;

	Ev::Io<RelayOutcome> attempt( std::shared_ptr<Nostr::Event const> ev
				    , RelayTarget target
				    , std::size_t attempts
				    , double delay
				    );

public:
	Publisher() =delete;
	Publisher( Nostr::RelayIF& relay_
		 , std::function<Ev::Io<void>(double)> sleep_
		 , std::size_t retries_
		 , double backoff_
		 ) : relay(relay_)
		   , sleep(std::move(sleep_))
		   , retries(retries_)
		   , backoff(backoff_)
		   { }

	Ev::Io<std::vector<RelayOutcome>>
	publish( Nostr::Event const& event
	       , std::vector<RelayTarget> targets
	       );

	/** Zap::Publisher::satisfied
	 *
	 * @brief whether the relays that accepted so far are
	 * enough to consider the event delivered.
	 *
	 * @desc Best-effort needs any one acceptance.  Strict
	 * needs every configured relay in `targets`; hint
	 * relays never count against it.
	 */
	static
	bool satisfied( std::vector<RelayTarget> const& targets
		      , std::set<std::string> const& accepted
		      , bool strict
		      );
};

}

#endif /* !defined(ZAP_PUBLISHER_HPP) */
