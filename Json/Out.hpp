#ifndef JSON_OUT_HPP
#define JSON_OUT_HPP

#include"Jsmn/Detail/Str.hpp"
#include"Jsmn/Object.hpp"
#include<cstddef>
#include<cstdint>
#include<memory>
#include<sstream>
#include<string>
#include<type_traits>
#include<vector>

namespace Json { class Out; }

namespace Json { namespace Detail {

typedef std::ostringstream Content;
template<typename Up> class Array;
template<typename Up> class Object;

/* Simple type serialization.  */
template<typename t, typename Enable = void>
struct Serializer;

template<typename t>
struct Serializer< t
		 , typename std::enable_if< std::is_integral<t>::value
					 && !std::is_same<t, bool>::value
					  >::type
		 > {
	static std::string serialize(t v) {
		return std::to_string(v);
	}
};
template<>
struct Serializer<double> {
	static std::string serialize(double v) {
		return Jsmn::Detail::Str::from_double(v);
	}
};
template<>
struct Serializer<bool> {
	static std::string serialize(bool v) {
		return v ? "true" : "false";
	}
};
template<>
struct Serializer<std::string> {
	static std::string serialize(std::string const& v) {
		return "\"" + Jsmn::Detail::Str::to_escaped(v) + "\"";
	}
};
template<std::size_t n>
struct Serializer<char [n]> {
	static std::string serialize(char const v[n]) {
		return "\"" + Jsmn::Detail::Str::to_escaped(v) + "\"";
	}
};
template<>
struct Serializer<std::nullptr_t> {
	static std::string serialize(std::nullptr_t) {
		return "null";
	}
};
template<typename a>
struct Serializer<std::unique_ptr<a>> {
	static std::string serialize(std::unique_ptr<a> const& p) {
		if (!p)
			return "null";
		return Serializer<a>::serialize(*p);
	}
};
template<typename a>
struct Serializer<std::vector<a>> {
	static std::string serialize(std::vector<a> const& vs) {
		auto rv = std::string("[");
		for (auto i = std::size_t(0); i < vs.size(); ++i) {
			if (i != 0)
				rv += ",";
			rv += Serializer<a>::serialize(vs[i]);
		}
		rv += "]";
		return rv;
	}
};

/* Builders write compact JSON, with no whitespace
 * between tokens.  */
template<typename Up>
class Object {
private:
	Up& up;
	Content& content;
	bool started;

	void key(std::string const& name) {
		if (started)
			content << ',';
		started = true;
		content << Serializer<std::string>::serialize(name) << ':';
	}

public:
	Object(Up& up_, Content& content_)
		: up(up_), content(content_), started(false) {
		content << '{';
	}

	template<typename a>
	Object<Up>& field(std::string const& name, a const& value) {
		key(name);
		content << Serializer<a>::serialize(value);
		return *this;
	}

	/* Declared later when all types are completed.  */
	Array<Object<Up>> start_array(std::string const& name);
	Object<Object<Up>> start_object(std::string const& name);

	Up& end_object() {
		content << '}';
		return up;
	}
};

template<typename Up>
class Array {
private:
	Up& up;
	Content& content;
	bool started;

	void comma() {
		if (started)
			content << ',';
		started = true;
	}

public:
	Array(Up& up_, Content& content_)
		: up(up_), content(content_), started(false) {
		content << '[';
	}

	template<typename a>
	Array<Up>& entry(a const& value) {
		comma();
		content << Serializer<a>::serialize(value);
		return *this;
	}

	/* Declared later when all types are completed.  */
	Array<Array<Up>> start_array();
	Object<Array<Up>> start_object();

	Up& end_array() {
		content << ']';
		return up;
	}
};

} /* namespace Detail */

/** class Json::Out
 *
 * @brief Builds a JSON text.
 *
 * @desc Copies share the same buffer, so a builder chain
 * started from one copy shows up in all of them.
 */
class Out {
private:
	std::shared_ptr<Json::Detail::Content> content;

public:
	Out() : content(std::make_shared<Json::Detail::Content>()) { }
	explicit
	Out(Jsmn::Object const& js) : Out() {
		*content << js;
	}

	/* Embeds already-serialized JSON text verbatim.  */
	static
	Json::Out direct(std::string const& text) {
		auto rv = Json::Out();
		*rv.content << text;
		return rv;
	}

	std::string output() const {
		return content->str();
	}

	Json::Detail::Object<Json::Out> start_object() {
		return Json::Detail::Object<Json::Out>(*this, *content);
	}
	Json::Detail::Array<Json::Out> start_array() {
		return Json::Detail::Array<Json::Out>(*this, *content);
	}

	static
	Json::Out empty_object() {
		return Json::Out().start_object().end_object();
	}
};

namespace Detail {

/* JSON data.  */
template<>
struct Serializer<Json::Out> {
	static std::string serialize(Json::Out const& v) {
		return v.output();
	}
};
template<>
struct Serializer<Jsmn::Object> {
	static std::string serialize(Jsmn::Object const& v) {
		return v.direct_text();
	}
};

/* Sub-objects and sub-arrays.  */
template<typename Up>
Array<Object<Up>> Object<Up>::start_array(std::string const& name) {
	key(name);
	return Array<Object<Up>>(*this, content);
}
template<typename Up>
Object<Object<Up>> Object<Up>::start_object(std::string const& name) {
	key(name);
	return Object<Object<Up>>(*this, content);
}
template<typename Up>
Array<Array<Up>> Array<Up>::start_array() {
	comma();
	return Array<Array<Up>>(*this, content);
}
template<typename Up>
Object<Array<Up>> Array<Up>::start_object() {
	comma();
	return Object<Array<Up>>(*this, content);
}

} /* namespace Detail */

} /* namespace Json */

#endif /* !defined(JSON_OUT_HPP) */
