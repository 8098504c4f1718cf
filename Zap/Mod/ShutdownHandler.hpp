#ifndef ZAP_MOD_SHUTDOWNHANDLER_HPP
#define ZAP_MOD_SHUTDOWNHANDLER_HPP

namespace S { class Bus; }

namespace Zap { namespace Mod {

/** class Zap::Mod::ShutdownHandler
 *
 * @brief subscribes to the lightningd `shutdown`
 * notification and exits the plugin cleanly on it.
 */
class ShutdownHandler {
public:
	ShutdownHandler() =delete;
	explicit
	ShutdownHandler(S::Bus& bus);
};

}}

#endif /* !defined(ZAP_MOD_SHUTDOWNHANDLER_HPP) */
