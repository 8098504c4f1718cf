#include"Ev/Io.hpp"
#include"S/Bus.hpp"
#include"Zap/Mod/ShutdownHandler.hpp"
#include"Zap/Msg/Exit.hpp"
#include"Zap/Msg/ManifestNotification.hpp"
#include"Zap/Msg/Manifestation.hpp"
#include"Zap/Msg/Notification.hpp"
#include"Zap/log.hpp"

namespace Zap { namespace Mod {

ShutdownHandler::ShutdownHandler(S::Bus& bus) {
	bus.subscribe<Zap::Msg::Manifestation>([&bus](Zap::Msg::Manifestation const&) {
		return bus.raise(Zap::Msg::ManifestNotification{"shutdown"});
	});
	bus.subscribe<Zap::Msg::Notification>([&bus](Zap::Msg::Notification const& n) {
		if (n.notification != "shutdown")
			return Ev::lift();
		return Zap::log( bus, Info
			       , "ShutdownHandler: lightningd is shutting down."
			       ).then([&bus]() {
			return bus.raise(Zap::Msg::Exit{0, "shutdown"});
		});
	});
}

}}
