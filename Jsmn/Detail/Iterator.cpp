#include"Jsmn/Detail/Iterator.hpp"
#include"Jsmn/Detail/ParseResult.hpp"
#include"Jsmn/Object.hpp"

namespace Jsmn { namespace Detail {

void Token::next(Token const*& tokptr) {
	auto children = tokptr->size;
	++tokptr;
	for (auto n = 0; n < children; ++n)
		next(tokptr);
}

Iterator& Iterator::operator++() {
	Token const* tokptr = &r->tokens[i];
	Token::next(tokptr);
	i = (unsigned int) (tokptr - &r->tokens[0]);
	return *this;
}

Jsmn::Object Iterator::operator*() const {
	return Jsmn::Object(r, i);
}

}}
