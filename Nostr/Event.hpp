#ifndef NOSTR_EVENT_HPP
#define NOSTR_EVENT_HPP

#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<stdexcept>
#include<string>
#include<vector>

namespace Jsmn { class Object; }
namespace Secp256k1 { class PrivKey; }
namespace Secp256k1 { class Random; }
namespace Sha256 { class Hash; }

namespace Nostr {

/* Thrown when JSON does not have the shape of a Nostr event.  */
class EventError : public Util::BacktraceException<std::invalid_argument> {
public:
	explicit
	EventError(std::string const& msg)
		: Util::BacktraceException<std::invalid_argument>(
			"Nostr::Event: " + msg
		  ) { }
};

typedef std::vector<std::string> Tag;

/** struct Nostr::Event
 *
 * @brief a NIP-01 event.
 *
 * @desc `id`, `pubkey` and `sig` are kept as the hex
 * strings that appear on the wire.  A parsed event is
 * only shape-checked; use `verify` before trusting it.
 */
struct Event {
	std::string id;
	std::string pubkey;
	std::uint64_t created_at;
	std::uint32_t kind;
	std::vector<Tag> tags;
	std::string content;
	std::string sig;

	Event() : created_at(0), kind(0) { }

	/* Throws EventError if a field is missing or mistyped.  */
	static
	Event parse(Jsmn::Object const&);

	/* `[0,pubkey,created_at,kind,tags,content]`, the text
	 * the id hashes.  */
	std::string serialize() const;
	Sha256::Hash compute_id() const;

	/* True if `id` matches the content and `sig` is a valid
	 * BIP-340 signature of `id` by `pubkey`.  */
	bool verify() const;

	/* Sets pubkey, id and sig.  */
	void sign(Secp256k1::PrivKey const&, Secp256k1::Random&);

	/* Compact JSON object, as sent to relays.  */
	std::string to_json() const;

	/* Tags whose first element is `name`.  */
	std::vector<Tag> tags_named(std::string const& name) const;
};

/** Nostr::escape
 *
 * @brief escapes a string for the canonical event
 * serialization.
 *
 * @desc Only line feed, double quote, backslash,
 * carriage return, tab, backspace and form feed are
 * escaped; every other byte goes through unchanged.
 */
std::string escape(std::string const&);

}

#endif /* !defined(NOSTR_EVENT_HPP) */
