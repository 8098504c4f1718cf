#include"Jsmn/Detail/DatumEnd.hpp"
#include"Jsmn/Detail/ParseResult.hpp"
#include"Jsmn/Object.hpp"
#include"Jsmn/ParseError.hpp"
#include"Jsmn/Parser.hpp"
#include"Util/make_unique.hpp"
#include<cctype>

/* jsmn is header-only; instantiate it in this unit alone.  */
#define JSMN_STATIC 1
#define JSMN_STRICT 1		/* Reject sloppy JSON.  */
#define JSMN_PARENT_LINKS 1
#include<jsmn.h>

namespace {

Jsmn::Detail::Type type_convert(jsmntype_t t) {
	switch (t) {
	case JSMN_OBJECT: return Jsmn::Detail::Object;
	case JSMN_ARRAY: return Jsmn::Detail::Array;
	case JSMN_STRING: return Jsmn::Detail::String;
	case JSMN_PRIMITIVE: return Jsmn::Detail::Primitive;
	default: return Jsmn::Detail::Undefined;
	}
}

}

namespace Jsmn {

class Parser::Impl {
private:
	/* Text of the datum being accumulated.  */
	std::string pending;
	Detail::DatumEnd ender;
	std::vector<jsmntok_t> toks;

	Object parse_datum(std::string text) {
		if (toks.empty())
			toks.resize(64);
		for (;;) {
			auto base = jsmn_parser();
			jsmn_init(&base);
			auto res = jsmn_parse( &base
					     , text.data(), text.size()
					     , &toks[0], (unsigned int) toks.size()
					     );
			if (res == JSMN_ERROR_NOMEM) {
				toks.resize(toks.size() * 2);
				continue;
			}
			if (res <= 0)
				throw ParseError(text, base.pos);

			auto pr = std::make_shared<Detail::ParseResult>();
			pr->tokens.resize(std::size_t(res));
			for (auto n = 0; n < res; ++n) {
				auto& t = pr->tokens[std::size_t(n)];
				t.type = type_convert(toks[std::size_t(n)].type);
				t.start = toks[std::size_t(n)].start;
				t.end = toks[std::size_t(n)].end;
				t.size = toks[std::size_t(n)].size;
			}
			pr->orig_string = std::move(text);
			return Parser::wrap(std::move(pr));
		}
	}

public:
	std::vector<Object> feed(std::string const& s) {
		auto rv = std::vector<Object>();
		for (auto c : s) {
			if (!ender.inside()) {
				if (std::isspace((unsigned char) c))
					continue;
				if (c != '{' && c != '[') {
					auto bad = pending + c;
					pending.clear();
					throw ParseError(bad, (unsigned int) (bad.size() - 1));
				}
			}
			pending.push_back(c);
			if (ender.feed(c)) {
				auto text = std::move(pending);
				pending.clear();
				rv.emplace_back(parse_datum(std::move(text)));
			}
		}
		return rv;
	}

	bool empty() const { return pending.empty(); }
};

Object Parser::wrap(std::shared_ptr<Detail::ParseResult> pr) {
	return Object(std::move(pr), 0);
}

Parser::Parser() : pimpl(Util::make_unique<Impl>()) { }
Parser::Parser(Parser&& o) : pimpl(std::move(o.pimpl)) { }
Parser::~Parser() { }

std::vector<Jsmn::Object> Parser::feed(std::string const& s) {
	return pimpl->feed(s);
}
bool Parser::empty() const {
	return pimpl->empty();
}

}
