#ifndef JSMN_PARSER_HPP
#define JSMN_PARSER_HPP

#include<memory>
#include<string>
#include<vector>

namespace Jsmn { class Object; }
namespace Jsmn { namespace Detail { struct ParseResult; }}

namespace Jsmn {

/** class Jsmn::Parser
 *
 * @brief A stateful parser for a stream of JSON objects
 * or arrays, such as the replies arriving on the
 * lightningd RPC socket.
 *
 * @desc Text may be fed in arbitrary pieces; `feed`
 * returns every datum completed so far and buffers the
 * remainder for the next call.
 * Throws Jsmn::ParseError on malformed input.
 */
class Parser {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

	static Jsmn::Object wrap(std::shared_ptr<Detail::ParseResult>);

public:
	Parser();
	Parser(Parser&&);
	~Parser();

	std::vector<Jsmn::Object> feed(std::string const&);

	/* True if no partial datum is buffered.  */
	bool empty() const;
};

}

#endif /* !defined(JSMN_PARSER_HPP) */
