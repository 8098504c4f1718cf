#undef NDEBUG
#include"Util/Bech32.hpp"
#include"Util/Str.hpp"
#include<assert.h>
#include<cstdint>
#include<string>
#include<vector>

int main() {
	auto hrp = std::string();
	auto bytes = std::vector<std::uint8_t>();

	/* NIP-19 test vector.  */
	assert(Util::Bech32::decode( hrp, bytes
				   , "nsec1vl029mgpspedva04g90vltkh6fvh240zqtv9k0t9af8935ke9laqsnlfe5"
				   ));
	assert(hrp == "nsec");
	assert( Util::Str::hexdump(bytes.data(), bytes.size())
	     == "67dea2ed018072d675f5415ecfaed7d2597555e202d85b3d65ea4e58d2d92ffa"
	      );

	/* Upper case is fine as long as it is consistent.  */
	assert(Util::Bech32::decode( hrp, bytes
				   , "NSEC1VL029MGPSPEDVA04G90VLTKH6FVH240ZQTV9K0T9AF8935KE9LAQSNLFE5"
				   ));
	assert(hrp == "nsec");

	/* Broken checksum.  */
	assert(!Util::Bech32::decode( hrp, bytes
				    , "nsec1vl029mgpspedva04g90vltkh6fvh240zqtv9k0t9af8935ke9laqsnlfe6"
				    ));
	/* Mixed case.  */
	assert(!Util::Bech32::decode( hrp, bytes
				    , "nsec1VL029mgpspedva04g90vltkh6fvh240zqtv9k0t9af8935ke9laqsnlfe5"
				    ));
	/* No separator.  */
	assert(!Util::Bech32::decode(hrp, bytes, "vl029mgpspedva04g90vltkh6"));
	assert(!Util::Bech32::decode(hrp, bytes, ""));

	return 0;
}
