#include"Util/Str.hpp"
#include<algorithm>
#include<cctype>
#include<limits>
#include<memory>
#include<stdio.h>

namespace Util {
namespace Str {

namespace {

auto const hexdigits = "0123456789abcdef";

int hexval(char c) {
	if ('0' <= c && c <= '9')
		return c - '0';
	if ('a' <= c && c <= 'f')
		return c - 'a' + 10;
	if ('A' <= c && c <= 'F')
		return c - 'A' + 10;
	return -1;
}

}

std::string hexbyte(std::uint8_t v) {
	auto rv = std::string(2, '0');
	rv[0] = hexdigits[v >> 4];
	rv[1] = hexdigits[v & 0xF];
	return rv;
}

std::string hexdump(void const* vp, std::size_t s) {
	auto rv = std::string();
	rv.reserve(s * 2);
	auto p = (std::uint8_t const*) vp;
	for (auto i = std::size_t(0); i < s; ++i) {
		rv.push_back(hexdigits[p[i] >> 4]);
		rv.push_back(hexdigits[p[i] & 0xF]);
	}
	return rv;
}

std::vector<std::uint8_t> hexread(std::string const& s) {
	if ((s.length() % 2) != 0)
		throw HexParseFailure("String length must be even.");

	auto buf = std::vector<std::uint8_t>(s.length() / 2);
	for (auto i = std::size_t(0); i < buf.size(); ++i) {
		auto hi = hexval(s[i * 2]);
		auto lo = hexval(s[i * 2 + 1]);
		if (hi < 0 || lo < 0)
			throw HexParseFailure(
				"Non-hex character at offset " +
				std::to_string(hi < 0 ? i * 2 : i * 2 + 1)
			);
		buf[i] = std::uint8_t((hi << 4) | lo);
	}
	return buf;
}

bool ishex(std::string const& s) {
	if ((s.size() % 2) != 0)
		return false;
	return std::all_of(s.begin(), s.end(), [](char c) {
		return hexval(c) >= 0;
	});
}

bool islowerhex(std::string const& s, std::size_t len) {
	if (s.size() != len)
		return false;
	return std::all_of(s.begin(), s.end(), [](char c) {
		return ('0' <= c && c <= '9') || ('a' <= c && c <= 'f');
	});
}

std::string trim(std::string const& s) {
	auto is_space = [](char c) {
		return std::isspace((unsigned char) c) != 0;
	};
	auto start = std::find_if_not(s.begin(), s.end(), is_space);
	/* If all spaces, empty string.  */
	if (start == s.end())
		return "";
	auto end = std::find_if_not(s.rbegin(), s.rend(), is_space).base();
	return std::string(start, end);
}

bool parse_u64(std::string const& s, std::uint64_t& out) {
	if (s.empty() || s.size() > 20)
		return false;
	auto const max = std::numeric_limits<std::uint64_t>::max();
	auto v = std::uint64_t(0);
	for (auto c : s) {
		if (c < '0' || c > '9')
			return false;
		auto d = std::uint64_t(c - '0');
		if (v > (max - d) / 10)
			return false;
		v = v * 10 + d;
	}
	out = v;
	return true;
}

std::string percent_decode(std::string const& s) {
	auto rv = std::string();
	rv.reserve(s.size());
	for (auto i = std::size_t(0); i < s.size(); ++i) {
		auto c = s[i];
		if (c == '+') {
			rv.push_back(' ');
		} else if (c == '%') {
			if (i + 2 >= s.size())
				throw std::invalid_argument(
					"percent_decode: truncated escape"
				);
			auto hi = hexval(s[i + 1]);
			auto lo = hexval(s[i + 2]);
			if (hi < 0 || lo < 0)
				throw std::invalid_argument(
					"percent_decode: bad escape"
				);
			rv.push_back(char((hi << 4) | lo));
			i += 2;
		} else
			rv.push_back(c);
	}
	return rv;
}

std::string vfmt(char const* tpl, va_list ap_orig) {
	va_list ap;

	va_copy(ap, ap_orig);
	auto needed = vsnprintf(nullptr, 0, tpl, ap);
	va_end(ap);
	if (needed < 0)
		return std::string(tpl);

	auto buf = std::unique_ptr<char[]>(new char[std::size_t(needed) + 1]);
	va_copy(ap, ap_orig);
	vsnprintf(buf.get(), std::size_t(needed) + 1, tpl, ap);
	va_end(ap);

	return std::string(buf.get(), std::size_t(needed));
}
std::string fmt(char const* tpl, ...) {
	va_list ap;
	va_start(ap, tpl);
	auto rv = vfmt(tpl, ap);
	va_end(ap);
	return rv;
}

}
}
