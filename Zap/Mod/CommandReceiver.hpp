#ifndef ZAP_MOD_COMMANDRECEIVER_HPP
#define ZAP_MOD_COMMANDRECEIVER_HPP

#include<set>
#include<string>

namespace S { class Bus; }

namespace Zap { namespace Mod {

/** class Zap::Mod::CommandReceiver
 *
 * @brief turns JSON-RPC messages from lightningd into
 * Zap::Msg::CommandRequest and Zap::Msg::Notification,
 * and turns our responses back into JSON-RPC.
 *
 * @desc Responses to ids that are not pending are
 * dropped, so each request is answered at most once.
 */
class CommandReceiver {
private:
	S::Bus& bus;

	/* JSON text of ids awaiting a response.  */
	std::set<std::string> pendings;

	bool take_pending(std::string const& id);

public:
	explicit
	CommandReceiver(S::Bus& bus_);
};

}}

#endif /* !defined(ZAP_MOD_COMMANDRECEIVER_HPP) */
