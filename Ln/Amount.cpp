#include"Jsmn/Object.hpp"
#include"Ln/Amount.hpp"
#include"Util/Str.hpp"
#include<limits>
#include<stdexcept>

namespace {

bool parse(std::string const& s, std::uint64_t& msat) {
	auto suffix = [&s](std::string const& x) {
		return s.size() > x.size()
		    && s.compare(s.size() - x.size(), x.size(), x) == 0
		     ;
	};
	auto n = std::uint64_t();
	if (suffix("msat"))
		return Util::Str::parse_u64(s.substr(0, s.size() - 4), msat);
	if (suffix("sat")) {
		if (!Util::Str::parse_u64(s.substr(0, s.size() - 3), n))
			return false;
		if (n > std::numeric_limits<std::uint64_t>::max() / 1000)
			return false;
		msat = n * 1000;
		return true;
	}
	return Util::Str::parse_u64(s, msat);
}

}

namespace Ln {

Amount::Amount(std::string const& s) : v(0) {
	if (!parse(s, v))
		throw std::invalid_argument("Ln::Amount: invalid amount: " + s);
}

Amount::operator std::string() const {
	return std::to_string(v) + "msat";
}

bool Amount::valid_string(std::string const& s) {
	auto tmp = std::uint64_t();
	return parse(s, tmp);
}

Amount Amount::object(Jsmn::Object const& js) {
	if (js.is_string())
		return Amount(std::string(js));
	if (js.is_number()) {
		auto rv = Amount();
		if (!Util::Str::parse_u64(js.direct_text(), rv.v))
			throw std::invalid_argument(
				"Ln::Amount: not a whole msat amount: " +
				js.direct_text()
			);
		return rv;
	}
	throw std::invalid_argument("Ln::Amount: not an amount: " + js.direct_text());
}

}
