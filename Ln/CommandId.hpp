#ifndef LN_COMMANDID_HPP
#define LN_COMMANDID_HPP

#include<string>

namespace Jsmn { class Object; }

namespace Ln {

/** class Ln::CommandId
 *
 * @brief the `id` of a JSON-RPC request from lightningd.
 *
 * @desc lightningd may use numbers or strings as ids;
 * the id is kept as its original JSON text so the
 * response echoes it back exactly.
 */
class CommandId {
private:
	std::string text;

	explicit
	CommandId(std::string text_) : text(std::move(text_)) { }

public:
	CommandId() : text("null") { }

	/* Throws Jsmn::TypeError unless a number or string.  */
	static
	CommandId from_json(Jsmn::Object const&);

	std::string const& json() const { return text; }

	bool operator==(CommandId const& o) const { return text == o.text; }
	bool operator!=(CommandId const& o) const { return text != o.text; }
};

}

#endif /* !defined(LN_COMMANDID_HPP) */
