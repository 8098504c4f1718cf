#undef NDEBUG
#include"Nostr/Relay.hpp"
#include<assert.h>
#include<string>

namespace {

auto const id = std::string(64, 'a');

}

int main() {
	using Nostr::PublishResult;
	auto r = PublishResult();

	assert(Nostr::Relay::interpret_reply("[\"OK\",\"" + id + "\",true,\"\"]", id, r));
	assert(r.status == PublishResult::Accepted);

	/* Duplicates count as accepted.  */
	assert(Nostr::Relay::interpret_reply("[\"OK\",\"" + id + "\",true,\"duplicate: have it\"]", id, r));
	assert(r.status == PublishResult::Accepted);
	assert(r.message == "duplicate: have it");

	assert(Nostr::Relay::interpret_reply("[\"OK\",\"" + id + "\",false,\"blocked: no\"]", id, r));
	assert(r.status == PublishResult::Rejected);
	assert(r.message == "blocked: no");

	assert(Nostr::Relay::interpret_reply("[\"OK\",\"" + id + "\",false,\"invalid: bad sig\"]", id, r));
	assert(r.status == PublishResult::Rejected);

	assert(Nostr::Relay::interpret_reply("[\"OK\",\"" + id + "\",false,\"rate-limited: slow down\"]", id, r));
	assert(r.status == PublishResult::Transient);
	assert(Nostr::Relay::interpret_reply("[\"OK\",\"" + id + "\",false,\"error: db down\"]", id, r));
	assert(r.status == PublishResult::Transient);

	/* Message is optional.  */
	assert(Nostr::Relay::interpret_reply("[\"OK\",\"" + id + "\",false]", id, r));
	assert(r.status == PublishResult::Rejected);
	assert(r.message == "");

	/* Not an answer for this event.  */
	assert(!Nostr::Relay::interpret_reply("[\"OK\",\"" + std::string(64, 'b') + "\",true,\"\"]", id, r));
	assert(!Nostr::Relay::interpret_reply("[\"NOTICE\",\"hello\"]", id, r));
	assert(!Nostr::Relay::interpret_reply("[\"OK\",\"" + id + "\",\"true\"]", id, r));
	assert(!Nostr::Relay::interpret_reply("not json", id, r));
	assert(!Nostr::Relay::interpret_reply("{\"OK\":true}", id, r));

	return 0;
}
