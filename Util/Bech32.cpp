#include"Util/Bech32.hpp"
#include<algorithm>
#include<cctype>

namespace {

auto const charset = std::string("qpzry9x8gf2tvdw0s3jn54khce6mua7l");

std::uint32_t polymod(std::vector<std::uint8_t> const& values) {
	static std::uint32_t const gen[5] = {
		0x3b6a57b2, 0x26508e6d, 0x1ea119fa, 0x3d4233dd, 0x2a1462b3
	};
	auto chk = std::uint32_t(1);
	for (auto v : values) {
		auto top = chk >> 25;
		chk = ((chk & 0x1ffffff) << 5) ^ v;
		for (auto i = 0; i < 5; ++i)
			if ((top >> i) & 1)
				chk ^= gen[i];
	}
	return chk;
}

}

namespace Util { namespace Bech32 {

bool decode( std::string& hrp
	   , std::vector<std::uint8_t>& bytes
	   , std::string const& bech32
	   ) {
	auto has_lower = false;
	auto has_upper = false;
	for (auto c : bech32) {
		if (c < 33 || c > 126)
			return false;
		if (std::islower((unsigned char) c))
			has_lower = true;
		if (std::isupper((unsigned char) c))
			has_upper = true;
	}
	if (has_lower && has_upper)
		return false;

	auto sep = bech32.rfind('1');
	/* Need a nonempty HRP and at least the 6-char checksum.  */
	if (sep == std::string::npos || sep == 0 || sep + 7 > bech32.size())
		return false;

	auto lower = bech32;
	std::transform( lower.begin(), lower.end(), lower.begin()
		      , [](char c) { return char(std::tolower((unsigned char) c)); }
		      );
	auto h = lower.substr(0, sep);

	auto values = std::vector<std::uint8_t>();
	for (auto c : h)
		values.push_back(std::uint8_t(c) >> 5);
	values.push_back(0);
	for (auto c : h)
		values.push_back(std::uint8_t(c) & 31);

	auto data = std::vector<std::uint8_t>();
	for (auto i = sep + 1; i < lower.size(); ++i) {
		auto pos = charset.find(lower[i]);
		if (pos == std::string::npos)
			return false;
		data.push_back(std::uint8_t(pos));
	}
	values.insert(values.end(), data.begin(), data.end());
	if (polymod(values) != 1)
		return false;

	/* Strip the checksum and regroup 5-bit values to bytes.  */
	data.resize(data.size() - 6);
	auto out = std::vector<std::uint8_t>();
	auto acc = std::uint32_t(0);
	auto bits = 0;
	for (auto v : data) {
		acc = ((acc << 5) | v) & 0xFFF;
		bits += 5;
		if (bits >= 8) {
			bits -= 8;
			out.push_back(std::uint8_t((acc >> bits) & 0xFF));
		}
	}
	if (bits >= 5 || ((acc << (8 - bits)) & 0xFF) != 0)
		return false;

	hrp = std::move(h);
	bytes = std::move(out);
	return true;
}

}}
