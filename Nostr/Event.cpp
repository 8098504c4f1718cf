#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include"Nostr/Event.hpp"
#include"Secp256k1/PrivKey.hpp"
#include"Secp256k1/Random.hpp"
#include"Secp256k1/Signature.hpp"
#include"Secp256k1/XonlyPubKey.hpp"
#include"Sha256/Hash.hpp"
#include"Sha256/fun.hpp"
#include"Util/Str.hpp"

namespace {

std::string get_string(Jsmn::Object const& js, char const* field) {
	auto v = js[field];
	if (!v.is_string())
		throw Nostr::EventError(std::string(field) + " not string");
	return std::string(v);
}
std::uint64_t get_uint(Jsmn::Object const& js, char const* field) {
	auto v = js[field];
	auto rv = std::uint64_t();
	if (!v.is_number() || !Util::Str::parse_u64(v.direct_text(), rv))
		throw Nostr::EventError( std::string(field)
				       + " not unsigned integer"
				       );
	return rv;
}

std::string quoted(std::string const& s) {
	return "\"" + Nostr::escape(s) + "\"";
}

}

namespace Nostr {

std::string escape(std::string const& s) {
	auto rv = std::string();
	rv.reserve(s.size());
	for (auto c : s) {
		switch (c) {
		case '\n': rv += "\\n"; break;
		case '"': rv += "\\\""; break;
		case '\\': rv += "\\\\"; break;
		case '\r': rv += "\\r"; break;
		case '\t': rv += "\\t"; break;
		case '\b': rv += "\\b"; break;
		case '\f': rv += "\\f"; break;
		default: rv.push_back(c); break;
		}
	}
	return rv;
}

Event Event::parse(Jsmn::Object const& js) {
	if (!js.is_object())
		throw EventError("not an object");

	auto rv = Event();
	rv.id = get_string(js, "id");
	rv.pubkey = get_string(js, "pubkey");
	rv.created_at = get_uint(js, "created_at");
	auto kind = get_uint(js, "kind");
	if (kind > 65535)
		throw EventError("kind out of range");
	rv.kind = std::uint32_t(kind);
	rv.content = get_string(js, "content");
	rv.sig = get_string(js, "sig");

	auto tags = js["tags"];
	if (!tags.is_array())
		throw EventError("tags not array");
	for (auto tag : tags) {
		if (!tag.is_array())
			throw EventError("tag not array");
		auto t = Tag();
		for (auto e : tag) {
			if (!e.is_string())
				throw EventError("tag element not string");
			t.push_back(std::string(e));
		}
		rv.tags.push_back(std::move(t));
	}

	return rv;
}

std::string Event::serialize() const {
	auto rv = std::string("[0,");
	rv += quoted(pubkey);
	rv += ",";
	rv += std::to_string(created_at);
	rv += ",";
	rv += std::to_string(kind);
	rv += ",[";
	for (auto i = std::size_t(0); i < tags.size(); ++i) {
		if (i != 0)
			rv += ",";
		rv += "[";
		for (auto j = std::size_t(0); j < tags[i].size(); ++j) {
			if (j != 0)
				rv += ",";
			rv += quoted(tags[i][j]);
		}
		rv += "]";
	}
	rv += "],";
	rv += quoted(content);
	rv += "]";
	return rv;
}

Sha256::Hash Event::compute_id() const {
	return Sha256::fun(serialize());
}

bool Event::verify() const {
	if (!Util::Str::islowerhex(id, 64))
		return false;
	if (!Util::Str::islowerhex(pubkey, 64))
		return false;
	if (!Util::Str::islowerhex(sig, 128))
		return false;

	auto h = compute_id();
	if (std::string(h) != id)
		return false;

	try {
		auto pk = Secp256k1::XonlyPubKey(pubkey);
		auto s = Secp256k1::SchnorrSig(sig);
		return s.valid(pk, h);
	} catch (Secp256k1::InvalidPubKey const&) {
		return false;
	}
}

void Event::sign(Secp256k1::PrivKey const& sk, Secp256k1::Random& random) {
	pubkey = std::string(Secp256k1::XonlyPubKey(sk));
	auto h = compute_id();
	id = std::string(h);
	sig = std::string(Secp256k1::SchnorrSig::create(sk, h, random));
}

std::string Event::to_json() const {
	return Json::Out()
		.start_object()
			.field("id", id)
			.field("pubkey", pubkey)
			.field("created_at", created_at)
			.field("kind", kind)
			.field("tags", tags)
			.field("content", content)
			.field("sig", sig)
		.end_object()
		.output()
		;
}

std::vector<Tag> Event::tags_named(std::string const& name) const {
	auto rv = std::vector<Tag>();
	for (auto const& t : tags)
		if (!t.empty() && t[0] == name)
			rv.push_back(t);
	return rv;
}

}
