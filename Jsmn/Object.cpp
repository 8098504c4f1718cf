#include"Jsmn/Detail/DatumEnd.hpp"
#include"Jsmn/Detail/ParseResult.hpp"
#include"Jsmn/Detail/Str.hpp"
#include"Jsmn/Object.hpp"
#include"Jsmn/ParseError.hpp"
#include"Jsmn/Parser.hpp"

namespace Jsmn {

class Object::Impl {
private:
	std::shared_ptr<Detail::ParseResult> result;
	unsigned int i;

	Detail::Token const& token() const {
		return result->tokens[i];
	}
	std::string text(Detail::Token const& tok) const {
		return result->orig_string.substr( std::size_t(tok.start)
						 , std::size_t(tok.end - tok.start)
						 );
	}
	unsigned int index_of(Detail::Token const* tokptr) const {
		return (unsigned int) (tokptr - &result->tokens[0]);
	}

	/* Calls f(key, value-token) for each member until it
	 * returns true; returns the value token or nullptr.  */
	template<typename F>
	Detail::Token const* find_member(F f) const {
		auto& tok = token();
		if (tok.type != Detail::Object)
			throw TypeError();
		auto tokptr = &tok + 1;
		for (auto n = 0; n < tok.size; ++n) {
			auto key = Detail::Str::from_escaped(text(*tokptr));
			auto value = tokptr + 1;
			if (f(key))
				return value;
			Detail::Token::next(tokptr);
		}
		return nullptr;
	}

public:
	Impl( std::shared_ptr<Detail::ParseResult> result_
	    , unsigned int i_
	    ) : result(std::move(result_)), i(i_) { }

	Detail::Type type() const { return token().type; }
	char first_char() const {
		return result->orig_string[std::size_t(token().start)];
	}

	bool to_bool() const {
		if (type() != Detail::Primitive)
			throw TypeError();
		switch (first_char()) {
		case 't': return true;
		case 'f':
		case 'n': return false;
		default: throw TypeError();
		}
	}
	std::string to_string() const {
		if (type() != Detail::String)
			throw TypeError();
		return Detail::Str::from_escaped(text(token()));
	}
	double to_double() const {
		auto c = first_char();
		if (type() != Detail::Primitive || c == 't' || c == 'f' || c == 'n')
			throw TypeError();
		return Detail::Str::to_double(text(token()));
	}

	std::string direct_text() const {
		auto& tok = token();
		if (tok.type == Detail::String)
			/* jsmn excludes the quotes from string tokens.  */
			return result->orig_string.substr(
				std::size_t(tok.start - 1),
				std::size_t(tok.end - tok.start + 2)
			);
		return text(tok);
	}

	std::size_t size() const {
		auto t = type();
		if (t != Detail::Object && t != Detail::Array)
			throw TypeError();
		return std::size_t(token().size);
	}

	std::vector<std::string> keys() const {
		auto rv = std::vector<std::string>();
		find_member([&rv](std::string const& k) {
			rv.push_back(k);
			return false;
		});
		return rv;
	}
	std::shared_ptr<Impl> member(std::string const& s) const {
		auto value = find_member([&s](std::string const& k) {
			return k == s;
		});
		if (!value)
			return nullptr;
		return std::make_shared<Impl>(result, index_of(value));
	}
	std::shared_ptr<Impl> element(std::size_t n) const {
		auto& tok = token();
		if (tok.type != Detail::Array)
			throw TypeError();
		if (n >= std::size_t(tok.size))
			return nullptr;
		auto tokptr = &tok + 1;
		for (auto step = std::size_t(0); step < n; ++step)
			Detail::Token::next(tokptr);
		return std::make_shared<Impl>(result, index_of(tokptr));
	}

	Detail::Iterator begin() const {
		if (type() != Detail::Array)
			throw TypeError();
		return Detail::Iterator(result, i + 1);
	}
	Detail::Iterator end() const {
		if (type() != Detail::Array)
			throw TypeError();
		auto tokptr = &token();
		Detail::Token::next(tokptr);
		return Detail::Iterator(result, index_of(tokptr));
	}
};

Object::Object() : pimpl(nullptr) { }
Object::Object( std::shared_ptr<Detail::ParseResult> result
	      , unsigned int i
	      ) : pimpl(std::make_shared<Impl>(std::move(result), i)) { }

Object Object::parse_json(std::string const& text) {
	auto parser = Parser();
	auto objs = parser.feed(text);
	if (objs.size() != 1 || !parser.empty())
		throw ParseError(text, (unsigned int) text.size());
	return std::move(objs[0]);
}

bool Object::is_null() const {
	return !pimpl || ( pimpl->type() == Detail::Primitive
			&& pimpl->first_char() == 'n'
			 );
}
bool Object::is_boolean() const {
	if (!pimpl || pimpl->type() != Detail::Primitive)
		return false;
	auto c = pimpl->first_char();
	return c == 't' || c == 'f';
}
bool Object::is_string() const {
	return pimpl && pimpl->type() == Detail::String;
}
bool Object::is_object() const {
	return pimpl && pimpl->type() == Detail::Object;
}
bool Object::is_array() const {
	return pimpl && pimpl->type() == Detail::Array;
}
bool Object::is_number() const {
	if (!pimpl || pimpl->type() != Detail::Primitive)
		return false;
	auto c = pimpl->first_char();
	return c == '-' || ('0' <= c && c <= '9');
}

Object::operator bool() const {
	if (!pimpl)
		return false;
	return pimpl->to_bool();
}
Object::operator std::string() const {
	if (!pimpl)
		throw TypeError();
	return pimpl->to_string();
}
Object::operator double() const {
	if (!pimpl)
		throw TypeError();
	return pimpl->to_double();
}

std::size_t Object::size() const {
	if (!pimpl)
		throw TypeError();
	return pimpl->size();
}
std::vector<std::string> Object::keys() const {
	if (!pimpl)
		throw TypeError();
	return pimpl->keys();
}
bool Object::has(std::string const& key) const {
	if (!pimpl)
		throw TypeError();
	return !!pimpl->member(key);
}
Object Object::operator[](std::string const& key) const {
	if (!pimpl)
		throw TypeError();
	auto rv = Object();
	rv.pimpl = pimpl->member(key);
	return rv;
}
Object Object::operator[](std::size_t n) const {
	if (!pimpl)
		throw TypeError();
	auto rv = Object();
	rv.pimpl = pimpl->element(n);
	return rv;
}

std::string Object::direct_text() const {
	if (!pimpl)
		return "null";
	return pimpl->direct_text();
}

Object::iterator Object::begin() const {
	if (!pimpl)
		throw TypeError();
	return pimpl->begin();
}
Object::iterator Object::end() const {
	if (!pimpl)
		throw TypeError();
	return pimpl->end();
}

std::ostream& operator<<(std::ostream& os, Jsmn::Object const& o) {
	return os << o.direct_text();
}

std::istream& operator>>(std::istream& is, Jsmn::Object& o) {
	auto ender = Detail::DatumEnd();
	auto text = std::string();
	auto c = char();
	while (is.get(c)) {
		if (!ender.inside() && c != '{' && c != '[')
			/* Inter-message whitespace.  */
			continue;
		text.push_back(c);
		if (ender.feed(c)) {
			try {
				o = Object::parse_json(text);
			} catch (ParseError const&) {
				is.setstate(std::ios_base::failbit);
			}
			return is;
		}
	}
	return is;
}

}
