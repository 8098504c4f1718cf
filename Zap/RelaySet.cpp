#include"Util/Str.hpp"
#include"Zap/RelaySet.hpp"
#include<algorithm>
#include<ctype.h>
#include<set>

namespace Zap {

std::string normalize_relay(std::string const& url) {
	auto s = Util::Str::trim(url);
	if (!s.empty() && s.back() == '/')
		s.pop_back();

	auto colon = s.find("://");
	if (colon == std::string::npos)
		return "";
	auto scheme = s.substr(0, colon);
	std::transform( scheme.begin(), scheme.end(), scheme.begin()
		      , [](char c) { return char(tolower((unsigned char) c)); }
		      );
	if (scheme != "ws" && scheme != "wss")
		return "";
	auto rest = s.substr(colon + 3);
	if (rest.empty() || rest[0] == '/')
		return "";
	if (std::any_of(rest.begin(), rest.end(), [](char c) {
		return isspace((unsigned char) c);
	}))
		return "";
	return scheme + "://" + rest;
}

std::vector<RelayTarget>
relay_set( std::vector<std::string> const& configured
	 , std::vector<std::string> const& hints
	 ) {
	auto rv = std::vector<RelayTarget>();
	auto seen = std::set<std::string>();

	auto add = [&](std::string const& url, bool is_configured) {
		auto n = normalize_relay(url);
		if (n.empty() || !seen.insert(n).second)
			return;
		rv.push_back(RelayTarget{std::move(n), is_configured});
	};
	for (auto const& r : configured)
		add(r, true);
	for (auto const& r : hints)
		add(r, false);

	return rv;
}

}
