#ifndef NOSTR_RELAYIF_HPP
#define NOSTR_RELAYIF_HPP

#include<string>

namespace Ev { template<typename a> class Io; }
namespace Nostr { struct Event; }

namespace Nostr {

/** struct Nostr::PublishResult
 *
 * @brief what one relay did with one event.
 *
 * @desc Transient covers anything worth trying again
 * later (unreachable, timed out, rate-limited); a
 * Rejected event would be rejected again.
 */
struct PublishResult {
	enum Status {
		Accepted,
		Rejected,
		Transient
	};
	Status status;
	std::string message;
};

/** class Nostr::RelayIF
 *
 * @brief interface to something that delivers an
 * event to a relay and reports the outcome.
 */
class RelayIF {
public:
	virtual ~RelayIF() { }

	/* Never fails; problems are reported in the result.  */
	virtual
	Ev::Io<PublishResult> publish( std::string const& url
				     , Nostr::Event const& event
				     ) =0;
};

}

#endif /* !defined(NOSTR_RELAYIF_HPP) */
