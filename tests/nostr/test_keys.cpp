#undef NDEBUG
#include"Nostr/Keys.hpp"
#include"Secp256k1/PrivKey.hpp"
#include"Secp256k1/XonlyPubKey.hpp"
#include"zap/vectors.hpp"
#include<assert.h>
#include<string>

namespace {

bool rejected(std::string const& s) {
	try {
		Nostr::parse_secret_key(s);
	} catch (Nostr::KeyError const& e) {
		/* The key text never shows up in the error.  */
		assert(s.size() < 8 || std::string(e.what()).find(s) == std::string::npos);
		return true;
	}
	return false;
}

}

int main() {
	auto hex = Nostr::parse_secret_key(Vectors::secret_key);
	assert(std::string(Secp256k1::XonlyPubKey(hex)) == Vectors::public_key);

	/* NIP-19 vector.  */
	auto nsec = Nostr::parse_secret_key(
		"  nsec1vl029mgpspedva04g90vltkh6fvh240zqtv9k0t9af8935ke9laqsnlfe5\n"
	);
	assert(nsec == Secp256k1::PrivKey(std::string(
		"67dea2ed018072d675f5415ecfaed7d2597555e202d85b3d65ea4e58d2d92ffa"
	)));

	assert(rejected(""));
	assert(rejected("   "));
	/* Wrong prefix.  */
	assert(rejected("npub180cvv07tjdrrgpa0j7j7tmnyl2yr6yr7l8j4s3evf6u64th6gkwsyjh6w6"));
	/* Bad checksum.  */
	assert(rejected("nsec1vl029mgpspedva04g90vltkh6fvh240zqtv9k0t9af8935ke9laqsnlfe6"));
	/* Not hex, wrong length.  */
	assert(rejected(std::string(63, 'a')));
	assert(rejected(std::string(64, 'g')));
	/* Zero is not a valid scalar.  */
	assert(rejected(std::string(64, '0')));
	/* Neither is the group order.  */
	assert(rejected("fffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141"));

	return 0;
}
