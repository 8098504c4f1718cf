#include"Jsmn/Detail/Str.hpp"
#include"Jsmn/ParseError.hpp"
#include<cstdint>
#include<locale>
#include<sstream>

namespace {

int hexval(char c) {
	if ('0' <= c && c <= '9')
		return c - '0';
	if ('a' <= c && c <= 'f')
		return c - 'a' + 10;
	if ('A' <= c && c <= 'F')
		return c - 'A' + 10;
	return -1;
}

std::uint32_t read_u16(std::string const& s, std::size_t& i) {
	if (i + 4 > s.size())
		throw Jsmn::ParseError(s, (unsigned int) i);
	auto v = std::uint32_t(0);
	for (auto n = 0; n < 4; ++n) {
		auto d = hexval(s[i++]);
		if (d < 0)
			throw Jsmn::ParseError(s, (unsigned int) (i - 1));
		v = (v << 4) | std::uint32_t(d);
	}
	return v;
}

void put_utf8(std::string& out, std::uint32_t cp) {
	if (cp < 0x80) {
		out.push_back(char(cp));
	} else if (cp < 0x800) {
		out.push_back(char(0xC0 | (cp >> 6)));
		out.push_back(char(0x80 | (cp & 0x3F)));
	} else if (cp < 0x10000) {
		out.push_back(char(0xE0 | (cp >> 12)));
		out.push_back(char(0x80 | ((cp >> 6) & 0x3F)));
		out.push_back(char(0x80 | (cp & 0x3F)));
	} else {
		out.push_back(char(0xF0 | (cp >> 18)));
		out.push_back(char(0x80 | ((cp >> 12) & 0x3F)));
		out.push_back(char(0x80 | ((cp >> 6) & 0x3F)));
		out.push_back(char(0x80 | (cp & 0x3F)));
	}
}

}

namespace Jsmn { namespace Detail { namespace Str {

std::string to_escaped(std::string const& s) {
	static char const hexdigits[] = "0123456789abcdef";
	auto out = std::string();
	out.reserve(s.size());
	for (auto ch : s) {
		auto c = (unsigned char) ch;
		switch (c) {
		case '\"': out += "\\\""; break;
		case '\\': out += "\\\\"; break;
		case '\b': out += "\\b"; break;
		case '\f': out += "\\f"; break;
		case '\n': out += "\\n"; break;
		case '\r': out += "\\r"; break;
		case '\t': out += "\\t"; break;
		default:
			if (c < 0x20) {
				out += "\\u00";
				out.push_back(hexdigits[c >> 4]);
				out.push_back(hexdigits[c & 0xF]);
			} else
				out.push_back(ch);
			break;
		}
	}
	return out;
}

std::string from_escaped(std::string const& s) {
	auto out = std::string();
	out.reserve(s.size());
	auto i = std::size_t(0);
	while (i < s.size()) {
		auto c = s[i++];
		if (c != '\\') {
			out.push_back(c);
			continue;
		}
		if (i >= s.size())
			throw ParseError(s, (unsigned int) (i - 1));
		c = s[i++];
		switch (c) {
		case '\"': out.push_back('\"'); break;
		case '\\': out.push_back('\\'); break;
		case '/': out.push_back('/'); break;
		case 'b': out.push_back('\b'); break;
		case 'f': out.push_back('\f'); break;
		case 'n': out.push_back('\n'); break;
		case 'r': out.push_back('\r'); break;
		case 't': out.push_back('\t'); break;
		case 'u': {
			auto cp = read_u16(s, i);
			/* High surrogate followed by \u low surrogate.  */
			if ( 0xD800 <= cp && cp < 0xDC00
			  && i + 6 <= s.size()
			  && s[i] == '\\' && s[i + 1] == 'u'
			   ) {
				auto j = i + 2;
				auto lo = read_u16(s, j);
				if (0xDC00 <= lo && lo < 0xE000) {
					cp = 0x10000
					   + ((cp - 0xD800) << 10)
					   + (lo - 0xDC00)
					   ;
					i = j;
				}
			}
			put_utf8(out, cp);
		} break;
		default:
			throw ParseError(s, (unsigned int) (i - 1));
		}
	}
	return out;
}

double to_double(std::string const& s) {
	auto is = std::istringstream(s);
	is.imbue(std::locale::classic());
	auto ret = double(0);
	is >> ret;
	return ret;
}
std::string from_double(double d) {
	auto os = std::ostringstream();
	os.imbue(std::locale::classic());
	os.precision(17);
	os << d;
	return os.str();
}

}}}
