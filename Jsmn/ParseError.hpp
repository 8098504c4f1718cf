#ifndef JSMN_PARSEERROR_HPP
#define JSMN_PARSEERROR_HPP

#include"Util/BacktraceException.hpp"
#include<stdexcept>
#include<string>

namespace Jsmn {

/* Thrown on JSON parsing failure.  */
class ParseError : public Util::BacktraceException<std::runtime_error> {
private:
	static
	std::string enmessage(std::string const& input, unsigned int i) {
		auto from = i < 16 ? 0 : i - 16;
		return "JSON parse error at offset "
		     + std::to_string(i)
		     + " near: "
		     + input.substr(from, 32)
		     ;
	}

public:
	unsigned int offset;

	ParseError() =delete;
	ParseError( std::string const& input
		  , unsigned int i
		  ) : Util::BacktraceException<std::runtime_error>(enmessage(input, i))
		    , offset(i)
		    { }
};

}

#endif /* !defined(JSMN_PARSEERROR_HPP) */
