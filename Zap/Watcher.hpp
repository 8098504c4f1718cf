#ifndef ZAP_WATCHER_HPP
#define ZAP_WATCHER_HPP

#include<cstdint>
#include<functional>
#include<memory>

namespace Ev { template<typename a> class Io; }
namespace Jsmn { class Object; }
namespace Json { class Out; }
namespace Nostr { class RelayIF; }
namespace S { class Bus; }
namespace Zap { namespace Msg { struct ZapSettings; }}

namespace Zap {

/** class Zap::Watcher
 *
 * @brief the payment loop: waits for the next paid
 * invoice after the cursor, turns it into a published
 * zap receipt if it is a zap, and only then moves the
 * cursor.
 *
 * @desc One payment is handled at a time.  A receipt
 * that could not be delivered is kept, and the same
 * payment is retried on the next cycle, sending only to
 * relays that have not accepted it yet.
 *
 * The node and relays are reached only through the
 * given functions and interface, so tests can fake
 * them.
 */
class Watcher {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Watcher() =delete;
	Watcher(Watcher const&) =delete;

	Watcher( S::Bus& bus
	       , Zap::Msg::ZapSettings const& settings
	       , Nostr::RelayIF& relay
	       /* `waitanyinvoice` with the given `lastpay_index`.  */
	       , std::function<Ev::Io<Jsmn::Object>(std::uint64_t)> wait_invoice
	       , std::function<Ev::Io<void>(double)> sleep
	       /* Seconds since the epoch.  */
	       , std::function<double()> clock
	       );
	Watcher(Watcher&&);
	~Watcher();

	/* Reads the persisted cursor.  Throws
	 * Zap::CursorCorruption.  */
	void load_cursor();

	/* Runs cycles until it fails with Zap::Shutdown.  */
	Ev::Io<void> run();
	/* Handles exactly one `waitanyinvoice` result.  */
	Ev::Io<void> cycle();

	std::uint64_t get_cursor() const;
	/* `null` or the receipt being retried.  */
	Json::Out pending_status() const;
	bool is_stuck() const;
};

}

#endif /* !defined(ZAP_WATCHER_HPP) */
