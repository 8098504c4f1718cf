#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include"Jsmn/Object.hpp"
#include"Jsmn/Parser.hpp"
#include"Net/Fd.hpp"
#include"Zap/Main.hpp"
#include<assert.h>
#include<iostream>
#include<set>
#include<sstream>
#include<stdexcept>

/* Test that getmanifest makes Zap::Main describe the
 * commands, options and notifications we expect.
 */
namespace {
auto const expected_commands = std::vector<std::string>
{ "clzap-status"
};
auto const expected_options = std::vector<std::string>
{ "clzap-nostr-key"
, "clnzapper_nostr_nsec"
, "clzap-relay"
, "clnzapper_nostr_relay"
, "clzap-start-index"
, "clzap-cursor-path"
, "clnzapper_pay_index_path"
, "clzap-publish-retries"
, "clzap-publish-backoff"
, "clzap-relay-timeout"
, "clzap-strict-relays"
, "clzap-relay-ack"
, "clzap-receipt-comment"
, "clzap-use-request-relays"
, "clzap-stuck-alert-cycles"
, "clzap-give-up-cycles"
};
}

int main() {
	auto argv = std::vector<std::string>{"clzap"};

	auto cin = std::stringstream(R"JSON(
	{"jsonrpc": "2.0", "id": "cln:getmanifest#1", "method": "getmanifest", "params": {"allow-deprecated-apis": false}}
	)JSON");
	auto cout = std::stringstream("");
	auto cerr = std::stringstream("");

	auto dummy_open_rpc_socket = []( std::string const& lightning_dir
				       , std::string const& rpc_file
				       ) {
		throw std::runtime_error("Should not be called");
		return Net::Fd();
	};
	auto exited = false;
	auto main = Zap::Main( argv, cin, cout, cerr
			     , dummy_open_rpc_socket
			     , [&exited](int) { exited = true; }
			     );

	auto ec = Ev::start(main.run().then([](int ec) {
		/* Let queued output drain.  */
		return Ev::yield().then([]() {
			return Ev::yield();
		}).then([ec]() {
			return Ev::lift(ec);
		});
	}));
	assert(ec == 0);
	assert(!exited);

	std::cout << cout.str() << std::endl;

	auto parser = Jsmn::Parser();
	auto output = parser.feed(cout.str());
	assert(output.size() == 1);
	auto& resp = output[0];
	assert(resp.is_object());
	/* String ids are echoed back as-is.  */
	assert(resp["id"].direct_text() == "\"cln:getmanifest#1\"");
	assert(resp.has("result"));
	auto result = resp["result"];
	assert(result.is_object());
	assert(!bool(result["dynamic"]));
	assert(bool(result["nonnumericids"]));

	auto actual_commands = std::set<std::string>();
	for (auto cmd : result["rpcmethods"]) {
		assert(cmd.is_object());
		assert(cmd["name"].is_string());
		assert(cmd["usage"].is_string());
		assert(cmd["description"].is_string());
		actual_commands.emplace(std::string(cmd["name"]));
	}
	auto actual_options = std::set<std::string>();
	for (auto opt : result["options"]) {
		assert(opt.is_object());
		assert(opt["name"].is_string());
		assert(opt["type"].is_string());
		assert(opt["description"].is_string());
		actual_options.emplace(std::string(opt["name"]));
		if (std::string(opt["name"]) == "clzap-relay") {
			assert(bool(opt["multi"]));
			/* Left out so that an unset option can be
			 * told apart.  */
			assert(!opt.has("default"));
		}
		if (std::string(opt["name"]) == "clzap-publish-retries") {
			assert(std::string(opt["type"]) == "int");
			assert(double(opt["default"]) == 3);
		}
	}
	auto subscriptions = std::set<std::string>();
	for (auto s : result["subscriptions"])
		subscriptions.emplace(std::string(s));

	for (auto const& cmd : expected_commands)
		assert(actual_commands.count(cmd) == 1);
	for (auto const& opt : expected_options)
		assert(actual_options.count(opt) == 1);
	assert(actual_options.size() == expected_options.size());
	assert(subscriptions.count("shutdown") == 1);

	return 0;
}
