#include"Ev/Io.hpp"
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include"Nostr/Keys.hpp"
#include"S/Bus.hpp"
#include"Secp256k1/PrivKey.hpp"
#include"Util/Str.hpp"
#include"Util/make_unique.hpp"
#include"Zap/Mod/SettingsHandler.hpp"
#include"Zap/Msg/Init.hpp"
#include"Zap/Msg/ManifestOption.hpp"
#include"Zap/Msg/Manifestation.hpp"
#include"Zap/Msg/Option.hpp"
#include"Zap/Msg/ZapSettings.hpp"
#include"Zap/RelaySet.hpp"
#include"Zap/log.hpp"
#include<algorithm>
#include<stdlib.h>
#include<sys/stat.h>

namespace {

auto const key_option = std::string("clzap-nostr-key");
/* Option names from older zapper plugins.  */
auto const legacy_key_option = std::string("clnzapper_nostr_nsec");
auto const legacy_relay_option = std::string("clnzapper_nostr_relay");
auto const legacy_path_option = std::string("clnzapper_pay_index_path");

auto const default_relay = std::string("ws://localhost:8080");
auto const default_cursor_path = std::string("clzap/last_pay_index");

struct OptionSpec {
	char const* name;
	Zap::Msg::OptionType type;
	/* nullptr: lightningd passes nothing unless set.  */
	char const* default_json;
	bool multi;
	char const* description;
};

OptionSpec const option_specs[] = {
	{ "clzap-nostr-key", Zap::Msg::OptionType_String, "\"\"", false
	, "Nostr secret key for signing zap receipts, as hex or nsec1."
	},
	{ "clnzapper_nostr_nsec", Zap::Msg::OptionType_String, "\"\"", false
	, "Deprecated name of clzap-nostr-key."
	},
	{ "clnzapper_nostr_relay", Zap::Msg::OptionType_String, "\"\"", false
	, "Deprecated; adds one relay, like clzap-relay."
	},
	{ "clzap-relay", Zap::Msg::OptionType_String, nullptr, true
	, "Relay to publish zap receipts to; repeat for more relays. "
	  "ws://localhost:8080 if no relay is given."
	},
	{ "clzap-start-index", Zap::Msg::OptionType_Int, "0", false
	, "Invoice pay_index to start after if there is no cursor file."
	},
	{ "clzap-cursor-path", Zap::Msg::OptionType_String, "\"\"", false
	, "File holding the last handled pay_index, relative to the "
	  "lightning network directory.  Default: an existing "
	  "cln-zapper file, else clzap/last_pay_index."
	},
	{ "clnzapper_pay_index_path", Zap::Msg::OptionType_String, "\"\"", false
	, "Deprecated name of clzap-cursor-path."
	},
	{ "clzap-publish-retries", Zap::Msg::OptionType_Int, "3", false
	, "Extra attempts per relay after a transient failure."
	},
	{ "clzap-publish-backoff", Zap::Msg::OptionType_Int, "1", false
	, "Seconds before the first retry; doubles on each retry."
	},
	{ "clzap-relay-timeout", Zap::Msg::OptionType_Int, "10", false
	, "Seconds allowed for each relay attempt."
	},
	{ "clzap-strict-relays", Zap::Msg::OptionType_Bool, "false", false
	, "Only move past a payment once every clzap-relay accepted "
	  "its receipt."
	},
	{ "clzap-relay-ack", Zap::Msg::OptionType_String, "\"ok\"", false
	, "ok: a relay counts once it answers OK true; "
	  "sent: once the event was sent."
	},
	{ "clzap-receipt-comment", Zap::Msg::OptionType_String, "\"\"", false
	, "Content of every zap receipt."
	},
	{ "clzap-use-request-relays", Zap::Msg::OptionType_Bool, "true", false
	, "Also publish to the relays listed in the zap request."
	},
	{ "clzap-stuck-alert-cycles", Zap::Msg::OptionType_Int, "10", false
	, "Undelivered cycles on one payment before logging a "
	  "stuck-cursor alert; 0 disables."
	},
	{ "clzap-give-up-cycles", Zap::Msg::OptionType_Int, "0", false
	, "Undelivered cycles on one payment before skipping it; "
	  "0 never skips."
	},
};

std::string describe(std::string const& name, Jsmn::Object const& v) {
	return name + ": unusable value " + v.direct_text();
}

/* Value given for `name`, else its default, else null.  */
Jsmn::Object lookup( std::map<std::string, Jsmn::Object> const& values
		   , std::string const& name
		   ) {
	auto it = values.find(name);
	if (it != values.end() && !it->second.is_null())
		return it->second;
	for (auto const& s : option_specs) {
		if (name != s.name)
			continue;
		if (!s.default_json)
			return Jsmn::Object();
		return Jsmn::Object::parse_json(
			std::string("[") + s.default_json + "]"
		)[std::size_t(0)];
	}
	throw Zap::Mod::ConfigError("unknown option " + name);
}

std::string get_string( std::map<std::string, Jsmn::Object> const& values
		      , std::string const& name
		      ) {
	auto v = lookup(values, name);
	if (!v.is_string())
		throw Zap::Mod::ConfigError(describe(name, v));
	return std::string(v);
}

std::vector<std::string>
get_strings( std::map<std::string, Jsmn::Object> const& values
	   , std::string const& name
	   ) {
	auto v = lookup(values, name);
	auto rv = std::vector<std::string>();
	if (v.is_null())
		return rv;
	if (v.is_string()) {
		rv.push_back(std::string(v));
		return rv;
	}
	if (!v.is_array())
		throw Zap::Mod::ConfigError(describe(name, v));
	for (auto e : v) {
		if (!e.is_string())
			throw Zap::Mod::ConfigError(describe(name, e));
		rv.push_back(std::string(e));
	}
	return rv;
}

/* lightningd gives numbers, older ones give strings.  */
std::uint64_t get_uint( std::map<std::string, Jsmn::Object> const& values
		      , std::string const& name
		      ) {
	auto v = lookup(values, name);
	auto text = v.is_string() ? std::string(v) : v.direct_text();
	auto rv = std::uint64_t();
	if ( !(v.is_string() || v.is_number())
	  || !Util::Str::parse_u64(Util::Str::trim(text), rv)
	   )
		throw Zap::Mod::ConfigError(describe(name, v));
	return rv;
}

bool get_bool( std::map<std::string, Jsmn::Object> const& values
	     , std::string const& name
	     ) {
	auto v = lookup(values, name);
	if (v.is_boolean())
		return bool(v);
	if (v.is_string()) {
		auto s = std::string(v);
		if (s == "true")
			return true;
		if (s == "false")
			return false;
	}
	throw Zap::Mod::ConfigError(describe(name, v));
}

Secp256k1::PrivKey get_key(std::map<std::string, Jsmn::Object> const& values) {
	auto text = Util::Str::trim(get_string(values, key_option));
	if (text.empty())
		text = Util::Str::trim(get_string(values, legacy_key_option));
	if (text.empty())
		throw Zap::Mod::ConfigError(
			"no Nostr key: set " + key_option
		);
	try {
		return Nostr::parse_secret_key(text);
	} catch (Nostr::KeyError const& e) {
		throw Zap::Mod::ConfigError(
			key_option + ": " + std::string(e.what())
		);
	}
}

}

namespace Zap { namespace Mod {

Zap::Msg::ZapSettings
SettingsHandler::make_settings( std::map<std::string, Jsmn::Object> const& values
			      , std::string const& legacy_cursor
			      ) {
	auto key = get_key(values);

	auto given = get_strings(values, "clzap-relay");
	if (given.empty() && values.count("clzap-relay") != 0
	 && !values.find("clzap-relay")->second.is_null())
		throw ConfigError("no relays configured: clzap-relay is empty");
	auto legacy_relay = Util::Str::trim(get_string(values, legacy_relay_option));
	if (!legacy_relay.empty())
		given.push_back(legacy_relay);
	if (given.empty())
		given.push_back(default_relay);

	auto relays = std::vector<std::string>();
	for (auto const& r : given) {
		auto n = normalize_relay(r);
		if (n.empty())
			throw ConfigError("clzap-relay: not a ws:// or wss:// "
					  "URL: " + r);
		if (std::find(relays.begin(), relays.end(), n) == relays.end())
			relays.push_back(n);
	}

	/* Explicit path, then the old option, then a file the
	 * old plugin left behind.  */
	auto cursor_path = Util::Str::trim(get_string(values, "clzap-cursor-path"));
	if (cursor_path.empty())
		cursor_path = Util::Str::trim(get_string(values, legacy_path_option));
	if (cursor_path.empty())
		cursor_path = legacy_cursor;
	if (cursor_path.empty())
		cursor_path = default_cursor_path;

	auto ack = get_string(values, "clzap-relay-ack");
	if (ack != "ok" && ack != "sent")
		throw ConfigError("clzap-relay-ack: expected ok or sent, "
				  "got " + ack);

	auto timeout = get_uint(values, "clzap-relay-timeout");
	if (timeout == 0)
		throw ConfigError("clzap-relay-timeout must be positive");

	return Zap::Msg::ZapSettings{
		key,
		std::move(relays),
		get_uint(values, "clzap-start-index"),
		cursor_path,
		std::size_t(get_uint(values, "clzap-publish-retries")),
		double(get_uint(values, "clzap-publish-backoff")),
		double(timeout),
		get_bool(values, "clzap-strict-relays"),
		ack == "ok",
		get_string(values, "clzap-receipt-comment"),
		get_bool(values, "clzap-use-request-relays"),
		std::size_t(get_uint(values, "clzap-stuck-alert-cycles")),
		std::size_t(get_uint(values, "clzap-give-up-cycles"))
	};
}

std::string SettingsHandler::legacy_cursor_file() {
	auto base = std::string();
	auto xdg = getenv("XDG_DATA_HOME");
	auto home = getenv("HOME");
	if (xdg && xdg[0] == '/')
		base = xdg;
	else if (home && home[0] != 0)
		base = std::string(home) + "/.local/share";
	else
		return "";
	auto path = base + "/cln-zapper/last_pay_index";
	struct stat st;
	if (stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode))
		return "";
	return path;
}

class SettingsHandler::Impl {
private:
	S::Bus& bus;
	std::map<std::string, Jsmn::Object> values;

	bool is_set(std::string const& name) const {
		auto v = lookup(values, name);
		return v.is_string() && !Util::Str::trim(std::string(v)).empty();
	}

	Ev::Io<void> report(Zap::Msg::ZapSettings const& s) {
		auto relays = std::string();
		for (auto const& r : s.relays)
			relays += (relays.empty() ? "" : " ") + r;
		return Zap::log( bus, Info
			       , "SettingsHandler: relays %s; %s mode, "
				 "ack on %s, %zu retries, cursor %s."
			       , relays.c_str()
			       , s.strict_relays ? "strict" : "best-effort"
			       , s.wait_ok ? "ok" : "sent"
			       , s.publish_retries
			       , s.cursor_path.c_str()
			       );
	}

public:
	explicit
	Impl(S::Bus& bus_) : bus(bus_) {
		bus.subscribe<Zap::Msg::Manifestation>([this](Zap::Msg::Manifestation const&) {
			auto act = Ev::lift();
			for (auto const& s : option_specs) {
				auto msg = Zap::Msg::ManifestOption{
					s.name, s.type,
					s.default_json ? Json::Out::direct(s.default_json)
						       : Json::Out(),
					s.description, s.multi
				};
				act = act.then([this, msg]() {
					return bus.raise(msg);
				});
			}
			return act;
		});
		bus.subscribe<Zap::Msg::Option>([this](Zap::Msg::Option const& o) {
			values[o.name] = o.value;
			return Ev::lift();
		});
		bus.subscribe<Zap::Msg::Init>([this](Zap::Msg::Init const&) {
			auto settings = std::make_shared<Zap::Msg::ZapSettings>(
				make_settings(values, legacy_cursor_file())
			);
			auto act = Ev::lift();
			for (auto const& n : { std::make_pair(legacy_key_option, key_option)
					     , std::make_pair(legacy_relay_option, std::string("clzap-relay"))
					     , std::make_pair(legacy_path_option, std::string("clzap-cursor-path"))
					     }) {
				if (!is_set(n.first))
					continue;
				act = act.then([this, n]() {
					return Zap::log( bus, Warn
						       , "SettingsHandler: %s is "
							 "deprecated, use %s."
						       , n.first.c_str()
						       , n.second.c_str()
						       );
				});
			}
			return act.then([this, settings]() {
				return report(*settings);
			}).then([this, settings]() {
				return bus.raise(*settings);
			});
		});
	}
};

SettingsHandler::SettingsHandler(S::Bus& bus)
	: pimpl(Util::make_unique<Impl>(bus)) { }
SettingsHandler::SettingsHandler(SettingsHandler&&) =default;
SettingsHandler::~SettingsHandler() =default;

}}
