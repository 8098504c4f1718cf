#ifndef ZAP_MOD_MANIFESTER_HPP
#define ZAP_MOD_MANIFESTER_HPP

#include"Zap/Msg/ManifestCommand.hpp"
#include"Zap/Msg/ManifestOption.hpp"
#include<map>
#include<set>
#include<string>

namespace S { class Bus; }

namespace Zap { namespace Mod {

/** class Zap::Mod::Manifester
 *
 * @brief answers `getmanifest` with whatever the other
 * modules register during Zap::Msg::Manifestation.
 */
class Manifester {
private:
	S::Bus& bus;
	std::map<std::string, Zap::Msg::ManifestCommand> commands;
	std::map<std::string, Zap::Msg::ManifestOption> options;
	std::set<std::string> notifications;

	void start();

public:
	explicit
	Manifester(S::Bus& bus_) : bus(bus_) { start(); }
};

}}

#endif /* !defined(ZAP_MOD_MANIFESTER_HPP) */
