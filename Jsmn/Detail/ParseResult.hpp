#ifndef JSMN_DETAIL_PARSERESULT_HPP
#define JSMN_DETAIL_PARSERESULT_HPP

#include"Jsmn/Detail/Token.hpp"
#include<string>
#include<vector>

namespace Jsmn { namespace Detail {

/* One parsed datum: its text and its tokens.  Shared by
 * every Jsmn::Object that refers into it.  */
struct ParseResult {
	std::string orig_string;
	std::vector<Token> tokens;
};

}}

#endif /* !defined(JSMN_DETAIL_PARSERESULT_HPP) */
