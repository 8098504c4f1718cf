#ifndef ZAP_MOD_STATUSCOMMAND_HPP
#define ZAP_MOD_STATUSCOMMAND_HPP

#include"Json/Out.hpp"
#include"Ln/CommandId.hpp"
#include<map>
#include<string>

namespace Ev { template<typename a> class Io; }
namespace S { class Bus; }
namespace Zap { namespace Msg { struct CommandRequest; }}
namespace Zap { namespace Msg { struct Manifestation; }}
namespace Zap { namespace Msg { struct ProvideStatus; }}

namespace Zap { namespace Mod {

/** class Zap::Mod::StatusCommand
 *
 * @brief implements `clzap-status` by soliciting
 * Zap::Msg::ProvideStatus fields from the other
 * modules.
 */
class StatusCommand {
private:
	S::Bus& bus;
	Ln::CommandId id;
	bool soliciting;
	std::map<std::string, Json::Out> fields;

	void start();
	Ev::Io<void> on_manifest(Zap::Msg::Manifestation const&);
	Ev::Io<void> on_command(Zap::Msg::CommandRequest const&);
	Ev::Io<void> on_status(Zap::Msg::ProvideStatus const&);

public:
	StatusCommand() =delete;
	StatusCommand(StatusCommand const&) =delete;
	StatusCommand(StatusCommand&&) =delete;

	explicit
	StatusCommand(S::Bus& bus_) : bus(bus_)
				    , id()
				    , soliciting(false)
				    { start(); }
};

}}

#endif /* !defined(ZAP_MOD_STATUSCOMMAND_HPP) */
