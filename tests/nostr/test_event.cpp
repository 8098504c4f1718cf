#undef NDEBUG
#include"Jsmn/Object.hpp"
#include"Nostr/Event.hpp"
#include"Secp256k1/PrivKey.hpp"
#include"Secp256k1/Random.hpp"
#include"Sha256/Hash.hpp"
#include"zap/vectors.hpp"
#include<assert.h>
#include<string>

namespace {

bool parse_fails(std::string const& json) {
	try {
		Nostr::Event::parse(Jsmn::Object::parse_json(json));
	} catch (Nostr::EventError const&) {
		return true;
	}
	return false;
}

}

int main() {
	/* Canonical escaping leaves other control bytes alone.  */
	assert(Nostr::escape("a\"b\\c\nd\te\rf\bg\fh") == "a\\\"b\\\\c\\nd\\te\\rf\\bg\\fh");
	assert(Nostr::escape(std::string("\x01/\xc3\xa9")) == std::string("\x01/\xc3\xa9"));

	{
		auto ev = Nostr::Event();
		ev.pubkey = "ab";
		ev.created_at = 1;
		ev.kind = 1;
		ev.tags = {{"p", "x"}, {"relays", "wss://a", "wss://b"}};
		ev.content = "hi\n";
		assert( ev.serialize()
		     == "[0,\"ab\",1,1,[[\"p\",\"x\"],[\"relays\",\"wss://a\",\"wss://b\"]],\"hi\\n\"]"
		      );
		assert(ev.tags_named("relays").size() == 1);
		assert(ev.tags_named("e").empty());
	}

	{
		/* A request signed by a real wallet.  */
		auto ev = Nostr::Event::parse(
			Jsmn::Object::parse_json(Vectors::zap_request)
		);
		assert(ev.id == Vectors::zap_request_id);
		assert(ev.pubkey == Vectors::zap_sender);
		assert(ev.kind == 9734);
		assert(ev.created_at == 1678734288);
		assert(ev.tags.size() == 4);
		assert(ev.tags[2].size() == 14);
		assert(std::string(ev.compute_id()) == ev.id);
		assert(ev.verify());

		auto tampered = ev;
		tampered.content = "x";
		assert(!tampered.verify());
		tampered = ev;
		tampered.sig[0] = tampered.sig[0] == '0' ? '1' : '0';
		assert(!tampered.verify());
		tampered = ev;
		tampered.id = "C93B75FF70B07D28287059D750756F93281AC779CD780E7D61B781F9862C5A81";
		assert(!tampered.verify());

		/* Sending it back out gives an equivalent event.  */
		auto again = Nostr::Event::parse(
			Jsmn::Object::parse_json(ev.to_json())
		);
		assert(again.id == ev.id);
		assert(again.sig == ev.sig);
		assert(again.tags == ev.tags);
		assert(again.verify());
	}

	{
		auto random = Secp256k1::Random();
		auto key = Secp256k1::PrivKey(std::string(Vectors::secret_key));
		auto ev = Nostr::Event();
		ev.created_at = 1700000000;
		ev.kind = 9735;
		ev.tags = {{"p", Vectors::zap_recipient}};
		ev.content = "thanks \"friend\"";
		ev.sign(key, random);
		assert(ev.pubkey == Vectors::public_key);
		assert(ev.id.size() == 64);
		assert(ev.sig.size() == 128);
		assert(ev.verify());

		ev.created_at += 1;
		assert(!ev.verify());
	}

	assert(parse_fails("[]"));
	assert(parse_fails("{\"id\":\"a\"}"));
	assert(parse_fails(R"({"id":"a","pubkey":"b","created_at":-1,"kind":1,"tags":[],"content":"","sig":"c"})"));
	assert(parse_fails(R"({"id":"a","pubkey":"b","created_at":1,"kind":"1","tags":[],"content":"","sig":"c"})"));
	assert(parse_fails(R"({"id":"a","pubkey":"b","created_at":1,"kind":1,"tags":[["p",1]],"content":"","sig":"c"})"));
	assert(parse_fails(R"({"id":"a","pubkey":"b","created_at":1,"kind":1,"tags":{},"content":"","sig":"c"})"));
	assert(!parse_fails(R"({"id":"a","pubkey":"b","created_at":1,"kind":1,"tags":[],"content":"","sig":"c"})"));

	return 0;
}
