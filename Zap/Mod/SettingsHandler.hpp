#ifndef ZAP_MOD_SETTINGSHANDLER_HPP
#define ZAP_MOD_SETTINGSHANDLER_HPP

#include"Util/BacktraceException.hpp"
#include<map>
#include<memory>
#include<stdexcept>
#include<string>

namespace Jsmn { class Object; }
namespace S { class Bus; }
namespace Zap { namespace Msg { struct ZapSettings; }}

namespace Zap { namespace Mod {

/* An option value the plugin cannot run with.  */
class ConfigError : public Util::BacktraceException<std::invalid_argument> {
public:
	explicit
	ConfigError(std::string const& msg)
		: Util::BacktraceException<std::invalid_argument>(msg) { }
};

/** class Zap::Mod::SettingsHandler
 *
 * @brief registers the `clzap-*` options and, at
 * Zap::Msg::Init, validates the values lightningd gave
 * into a single Zap::Msg::ZapSettings.
 *
 * @desc A ConfigError thrown out of the Init handler
 * makes `init` fail.
 */
class SettingsHandler {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	SettingsHandler() =delete;
	explicit
	SettingsHandler(S::Bus& bus);
	SettingsHandler(SettingsHandler&&);
	~SettingsHandler();

	/* Builds settings from option values keyed by option
	 * name; absent options take their defaults.
	 * `legacy_cursor` is the cursor file an older zapper
	 * plugin left, or empty; it is used when no cursor
	 * path option is set.  Throws ConfigError.  */
	static
	Zap::Msg::ZapSettings
	make_settings( std::map<std::string, Jsmn::Object> const& values
		     , std::string const& legacy_cursor
		     );

	/* `cln-zapper/last_pay_index` under the XDG data
	 * directory if that file exists, else empty.  */
	static
	std::string legacy_cursor_file();
};

}}

#endif /* !defined(ZAP_MOD_SETTINGSHANDLER_HPP) */
