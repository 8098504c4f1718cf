#ifndef JSMN_OBJECT_HPP
#define JSMN_OBJECT_HPP

#include"Jsmn/Detail/Iterator.hpp"
#include"Util/BacktraceException.hpp"
#include<cstddef>
#include<istream>
#include<memory>
#include<ostream>
#include<stdexcept>
#include<string>
#include<vector>

namespace Jsmn { namespace Detail { struct ParseResult; }}
namespace Jsmn { class Parser; }

namespace Jsmn {

/* Thrown when converting or using as incorrect type.  */
class TypeError : public Util::BacktraceException<std::invalid_argument> {
public:
	TypeError() : Util::BacktraceException<std::invalid_argument>("Incorrect type.") { }
};

/** class Jsmn::Object
 *
 * @brief A read-only view of a JSON value inside a
 * parsed datum.
 *
 * @desc Copies are cheap and share the parsed text.
 * A default-constructed object, or the result of a
 * missing key or out-of-range index, is null.
 */
class Object {
private:
	class Impl;
	std::shared_ptr<Impl> pimpl;

	/* Used by class Parser to construct.  */
	Object( std::shared_ptr<Detail::ParseResult>
	      , unsigned int
	      );

public:
	/* Results in a null object.  */
	Object();

	Object(Object const&) =default;
	Object(Object&&) =default;
	Object& operator=(Object const&) =default;
	Object& operator=(Object&&) =default;

	/** Jsmn::Object::parse_json
	 *
	 * @brief Parses text holding exactly one JSON object
	 * or array (surrounding whitespace allowed).
	 *
	 * @desc Throws Jsmn::ParseError on invalid, incomplete,
	 * or trailing input.
	 */
	static Object parse_json(std::string const& text);

	/* Type queries on the object.  */
	bool is_null() const;
	bool is_boolean() const;
	bool is_string() const;
	bool is_object() const;
	bool is_array() const;
	bool is_number() const;

	/* Conversions will fail if not of the correct type!  */
	explicit operator bool() const; /* Return false if null as well.  */
	explicit operator std::string() const;
	explicit operator double() const;

	/* Number of keys for objects, number of elements for arrays.
	 * Will throw TypeError if not object or array.
	 */
	std::size_t size() const;

	/* Act as an object.  */
	std::vector<std::string> keys() const;
	bool has(std::string const&) const;
	Object operator[](std::string const&) const; /* Return null if key not exist.  */
	/* Act as an array.  */
	Object operator[](std::size_t) const; /* Return null if out-of-range.  */

	friend class Parser;
	friend class Jsmn::Detail::Iterator;

	/* The JSON text of this value exactly as received;
	 * strings include their quotes and escapes.  */
	std::string direct_text() const;

	/* Iterate over array elements.  */
	typedef Jsmn::Detail::Iterator const_iterator;
	typedef Jsmn::Detail::Iterator iterator;
	iterator begin() const;
	iterator end() const;
};

/* Writes the value's original text.  */
std::ostream& operator<<(std::ostream&, Jsmn::Object const&);
/* Reads exactly one object or array from the stream,
 * setting failbit on parse errors and eofbit when the
 * stream ends before a datum completes.  */
std::istream& operator>>(std::istream&, Jsmn::Object&);

}

#endif /* !defined(JSMN_OBJECT_HPP) */
