#include"Jsmn/Detail/Str.hpp"
#include"Jsmn/Object.hpp"
#include"Jsmn/ParseError.hpp"
#include"Util/Str.hpp"
#include"Zap/extract_zap_request.hpp"
#include<stdexcept>

namespace {

Zap::Extraction absent(std::string reason) {
	auto rv = Zap::Extraction();
	rv.kind = Zap::Extraction::Absent;
	rv.reason = std::move(reason);
	return rv;
}
Zap::Extraction malformed(std::string reason) {
	auto rv = Zap::Extraction();
	rv.kind = Zap::Extraction::Malformed;
	rv.reason = std::move(reason);
	return rv;
}

bool starts_json(std::string const& s) {
	return !s.empty() && (s[0] == '{' || s[0] == '[' || s[0] == '"');
}

}

namespace Zap {

Extraction extract_zap_request(std::string const& description) {
	auto text = Util::Str::trim(description);
	if (text.empty())
		return absent("empty description");

	if (!starts_json(text)) {
		if (text.find('%') == std::string::npos)
			return absent("plain text");
		try {
			text = Util::Str::trim(Util::Str::percent_decode(text));
		} catch (std::invalid_argument const&) {
			return absent("plain text with stray %");
		}
		if (!starts_json(text))
			return absent("plain text");
	}

	if (text[0] == '"') {
		if (text.size() < 2 || text.back() != '"')
			return malformed("unterminated string literal");
		try {
			text = Util::Str::trim(Jsmn::Detail::Str::from_escaped(
				text.substr(1, text.size() - 2)
			));
		} catch (Jsmn::ParseError const&) {
			return malformed("bad escape in string literal");
		}
		if (text.empty() || text[0] != '{')
			return absent("string literal without an event");
	}

	if (text[0] != '{')
		return malformed("JSON but not an object");

	auto js = Jsmn::Object();
	try {
		js = Jsmn::Object::parse_json(text);
	} catch (Jsmn::ParseError const& e) {
		return malformed(e.what());
	}

	auto rv = Extraction();
	try {
		rv.request = Nostr::Event::parse(js);
	} catch (Nostr::EventError const& e) {
		return malformed(e.what());
	}
	rv.kind = Extraction::Found;
	rv.raw = std::move(text);
	return rv;
}

}
