#ifndef NOSTR_RELAY_HPP
#define NOSTR_RELAY_HPP

#include"Nostr/RelayIF.hpp"
#include<memory>

namespace Ev { class ThreadPool; }

namespace Nostr {

/** class Nostr::Relay
 *
 * @brief publishes events over a fresh WebSocket
 * connection per call, using libcurl.
 *
 * @desc The connection, send and wait for `OK` happen
 * in a background thread, bounded by `timeout`
 * seconds overall.  If `wait_ok` is false, a completed
 * send already counts as accepted.
 */
class Relay : public RelayIF {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Relay() =delete;
	Relay(Relay const&) =delete;

	Relay( Ev::ThreadPool& threadpool
	     , double timeout
	     , bool wait_ok
	     );
	Relay(Relay&&);
	~Relay();

	Ev::Io<PublishResult> publish( std::string const& url
				     , Nostr::Event const& event
				     ) override;

	/* Classify the reply to an `EVENT` message.
	 * Returns false if `frame` is not an `OK` for
	 * `id`.  */
	static
	bool interpret_reply( std::string const& frame
			    , std::string const& id
			    , PublishResult& result
			    );
};

}

#endif /* !defined(NOSTR_RELAY_HPP) */
