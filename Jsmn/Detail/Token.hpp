#ifndef JSMN_DETAIL_TOKEN_HPP
#define JSMN_DETAIL_TOKEN_HPP

namespace Jsmn { namespace Detail {

enum Type {
	Undefined,
	Object,
	Array,
	String,
	Primitive
};

/* A token over the original text, as jsmn produces it.
 * For objects `size` counts keys, for arrays elements,
 * and each key token has size 1 (its value).
 */
struct Token {
	Type type;
	int start;
	int end;
	int size;

	/* Advance past the given token and all its children.  */
	static void next(Token const*& tokptr);
};

}}

#endif /* !defined(JSMN_DETAIL_TOKEN_HPP) */
