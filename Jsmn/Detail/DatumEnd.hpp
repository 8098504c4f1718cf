#ifndef JSMN_DETAIL_DATUMEND_HPP
#define JSMN_DETAIL_DATUMEND_HPP

namespace Jsmn { namespace Detail {

/** class Jsmn::Detail::DatumEnd
 *
 * @brief Fed one character at a time, reports when a
 * top-level object or array has just been closed.
 *
 * @desc Characters outside any object or array (the
 * whitespace between JSON-RPC messages) are ignored.
 * Only brackets and string quoting are tracked; the
 * real validation is left to jsmn.
 */
class DatumEnd {
private:
	unsigned int nested;
	bool in_string;
	bool escaped;

public:
	DatumEnd() : nested(0), in_string(false), escaped(false) { }

	bool inside() const { return nested != 0; }

	/* Return true if the character closed a datum.  */
	bool feed(char c) noexcept {
		if (in_string) {
			if (escaped)
				escaped = false;
			else if (c == '\\')
				escaped = true;
			else if (c == '"')
				in_string = false;
			return false;
		}
		switch (c) {
		case '"':
			if (nested != 0)
				in_string = true;
			return false;
		case '{':
		case '[':
			++nested;
			return false;
		case '}':
		case ']':
			if (nested == 0)
				return false;
			--nested;
			return nested == 0;
		default:
			return false;
		}
	}
};

}}

#endif /* !defined(JSMN_DETAIL_DATUMEND_HPP) */
