#undef NDEBUG
#include"Jsmn/Object.hpp"
#include"Secp256k1/PrivKey.hpp"
#include"Zap/Mod/SettingsHandler.hpp"
#include"Zap/Msg/ZapSettings.hpp"
#include"zap/vectors.hpp"
#include<assert.h>
#include<map>
#include<cstdio>
#include<stdlib.h>
#include<string>
#include<sys/stat.h>
#include<unistd.h>
#include<vector>

namespace {

typedef std::map<std::string, Jsmn::Object> Values;

/* Option values as lightningd would pass them in
 * `init`.  */
Values values(std::string const& json) {
	auto js = Jsmn::Object::parse_json(json);
	auto rv = Values();
	for (auto const& k : js.keys())
		rv[k] = js[k];
	return rv;
}

Zap::Msg::ZapSettings make( std::string const& json
			  , std::string const& legacy_cursor = ""
			  ) {
	return Zap::Mod::SettingsHandler::make_settings( values(json)
						       , legacy_cursor
						       );
}

bool fails(std::string const& json) {
	try {
		make(json);
	} catch (Zap::Mod::ConfigError const&) {
		return true;
	}
	return false;
}

auto const key = std::string(Vectors::secret_key);
auto const with_key = "{\"clzap-nostr-key\": \"" + key + "\"";

}

int main() {
	{
		auto s = make(with_key + "}");
		assert(s.key == Secp256k1::PrivKey(key));
		assert(s.relays == std::vector<std::string>{"ws://localhost:8080"});
		assert(s.start_index == 0);
		assert(s.cursor_path == "clzap/last_pay_index");
		assert(s.publish_retries == 3);
		assert(s.publish_backoff == 1.0);
		assert(s.relay_timeout == 10.0);
		assert(!s.strict_relays);
		assert(s.wait_ok);
		assert(s.receipt_comment == "");
		assert(s.use_request_relays);
		assert(s.stuck_alert_cycles == 10);
		assert(s.give_up_cycles == 0);
	}
	{
		auto s = make(with_key + R"(
		, "clzap-relay": ["wss://relay.damus.io/", " WSS://nos.lol ", "wss://relay.damus.io"]
		, "clzap-start-index": 17
		, "clzap-cursor-path": "/var/lib/clzap/cursor"
		, "clzap-publish-retries": "5"
		, "clzap-publish-backoff": 2
		, "clzap-relay-timeout": 3
		, "clzap-strict-relays": true
		, "clzap-relay-ack": "sent"
		, "clzap-receipt-comment": "zapped!"
		, "clzap-use-request-relays": "false"
		, "clzap-stuck-alert-cycles": 0
		, "clzap-give-up-cycles": 100
		})");
		assert((s.relays == std::vector<std::string>{"wss://relay.damus.io", "wss://nos.lol"}));
		assert(s.start_index == 17);
		assert(s.cursor_path == "/var/lib/clzap/cursor");
		assert(s.publish_retries == 5);
		assert(s.publish_backoff == 2.0);
		assert(s.relay_timeout == 3.0);
		assert(s.strict_relays);
		assert(!s.wait_ok);
		assert(s.receipt_comment == "zapped!");
		assert(!s.use_request_relays);
		assert(s.stuck_alert_cycles == 0);
		assert(s.give_up_cycles == 100);
	}
	{
		/* Single relay given as a plain string.  */
		auto s = make(with_key + ", \"clzap-relay\": \"wss://nos.lol\"}");
		assert(s.relays == std::vector<std::string>{"wss://nos.lol"});
	}
	{
		/* The old option name still works, and nsec
		 * keys are accepted.  */
		auto s = make(R"({"clnzapper_nostr_nsec": "nsec1vl029mgpspedva04g90vltkh6fvh240zqtv9k0t9af8935ke9laqsnlfe5"})");
		assert(s.key == Secp256k1::PrivKey(std::string(
			"67dea2ed018072d675f5415ecfaed7d2597555e202d85b3d65ea4e58d2d92ffa"
		)));
		/* The new name wins.  */
		s = make(with_key + R"(, "clnzapper_nostr_nsec": "nsec1vl029mgpspedva04g90vltkh6fvh240zqtv9k0t9af8935ke9laqsnlfe5"})");
		assert(s.key == Secp256k1::PrivKey(key));
	}

	{
		/* Options of the older plugin keep working.  */
		auto s = make(R"({"clnzapper_nostr_nsec": "nsec1vl029mgpspedva04g90vltkh6fvh240zqtv9k0t9af8935ke9laqsnlfe5"
				, "clnzapper_nostr_relay": "wss://relay.damus.io"
				, "clnzapper_pay_index_path": "/home/ln/.local/share/cln-zapper/last_pay_index"
				})");
		assert(s.relays == std::vector<std::string>{"wss://relay.damus.io"});
		assert(s.cursor_path == "/home/ln/.local/share/cln-zapper/last_pay_index");

		/* The old relay adds to the new ones.  */
		s = make(with_key + R"(, "clzap-relay": ["wss://nos.lol"]
				      , "clnzapper_nostr_relay": "wss://relay.damus.io"
				      })");
		assert((s.relays == std::vector<std::string>{"wss://nos.lol", "wss://relay.damus.io"}));

		/* The new cursor path wins over the old one.  */
		s = make(with_key + R"(, "clzap-cursor-path": "cursor"
				      , "clnzapper_pay_index_path": "/old/path"
				      })");
		assert(s.cursor_path == "cursor");
	}
	{
		/* A cursor file left by the older plugin is used
		 * when no path is configured.  */
		auto s = make(with_key + "}", "/data/cln-zapper/last_pay_index");
		assert(s.cursor_path == "/data/cln-zapper/last_pay_index");
		s = make( with_key + ", \"clzap-cursor-path\": \"mine\"}"
			, "/data/cln-zapper/last_pay_index"
			);
		assert(s.cursor_path == "mine");
		s = make( with_key + ", \"clnzapper_pay_index_path\": \"/old\"}"
			, "/data/cln-zapper/last_pay_index"
			);
		assert(s.cursor_path == "/old");
		/* Blank means unset.  */
		s = make(with_key + ", \"clzap-cursor-path\": \" \"}");
		assert(s.cursor_path == "clzap/last_pay_index");
	}
	{
		/* Finding that file under the XDG data directory.  */
		char tmpl[] = "/tmp/clzap-test-settings-XXXXXX";
		auto dir = std::string(mkdtemp(tmpl));
		setenv("XDG_DATA_HOME", dir.c_str(), 1);
		assert(Zap::Mod::SettingsHandler::legacy_cursor_file() == "");

		auto sub = dir + "/cln-zapper";
		auto file = sub + "/last_pay_index";
		assert(mkdir(sub.c_str(), 0700) == 0);
		auto fd = fopen(file.c_str(), "w");
		assert(fd);
		fclose(fd);
		assert(Zap::Mod::SettingsHandler::legacy_cursor_file() == file);

		unlink(file.c_str());
		rmdir(sub.c_str());
		rmdir(dir.c_str());
	}

	assert(fails("{}"));
	assert(fails(R"({"clzap-nostr-key": "  "})"));
	assert(fails(R"({"clzap-nostr-key": "not a key"})"));
	assert(fails(with_key + ", \"clzap-relay\": []}"));
	assert(fails(with_key + ", \"clzap-relay\": [\"https://relay.damus.io\"]}"));
	assert(fails(with_key + ", \"clzap-relay\": [7]}"));
	assert(fails(with_key + ", \"clnzapper_nostr_relay\": \"http://x\"}"));
	assert(fails(with_key + ", \"clzap-relay-ack\": \"maybe\"}"));
	assert(fails(with_key + ", \"clzap-relay-timeout\": 0}"));
	assert(fails(with_key + ", \"clzap-publish-retries\": -1}"));
	assert(fails(with_key + ", \"clzap-publish-retries\": \"many\"}"));
	assert(fails(with_key + ", \"clzap-strict-relays\": \"yes\"}"));

	return 0;
}
