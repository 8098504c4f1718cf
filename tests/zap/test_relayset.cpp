#undef NDEBUG
#include"Zap/RelaySet.hpp"
#include<assert.h>

int main() {
	using Zap::normalize_relay;

	assert(normalize_relay("wss://relay.damus.io") == "wss://relay.damus.io");
	assert(normalize_relay(" wss://relay.damus.io/ \n") == "wss://relay.damus.io");
	assert(normalize_relay("WSS://relay.damus.io") == "wss://relay.damus.io");
	assert(normalize_relay("ws://localhost:8080") == "ws://localhost:8080");
	assert(normalize_relay("wss://nostr.example/inbox") == "wss://nostr.example/inbox");

	assert(normalize_relay("") == "");
	assert(normalize_relay("relay.damus.io") == "");
	assert(normalize_relay("https://relay.damus.io") == "");
	assert(normalize_relay("wss://") == "");
	assert(normalize_relay("wss:///path") == "");
	assert(normalize_relay("wss://bad host") == "");

	auto set = Zap::relay_set( {"wss://a", "wss://b/", "wss://a"}
				 , {"wss://c", "WSS://b", "nonsense", "wss://c/"}
				 );
	assert(set.size() == 3);
	assert(set[0].url == "wss://a");
	assert(set[0].configured);
	/* A hint naming a configured relay stays configured.  */
	assert(set[1].url == "wss://b");
	assert(set[1].configured);
	assert(set[2].url == "wss://c");
	assert(!set[2].configured);

	assert(Zap::relay_set({}, {}).empty());

	return 0;
}
