#undef NDEBUG
#include"Sha256/Hash.hpp"
#include"Sha256/Hasher.hpp"
#include"Sha256/fun.hpp"
#include<assert.h>
#include<string>

int main() {
	assert( std::string(Sha256::fun(std::string("")))
	     == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855"
	      );
	assert( std::string(Sha256::fun(std::string("abc")))
	     == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"
	      );

	/* Feeding in pieces gives the same result.  */
	auto hasher = Sha256::Hasher();
	hasher.feed("a", 1);
	hasher.feed("bc", 2);
	auto h = std::move(hasher).finalize();
	assert(h == Sha256::fun(std::string("abc")));

	auto parsed = Sha256::Hash(std::string(h));
	assert(parsed == h);
	assert(Sha256::Hash::valid_string(std::string(h)));
	assert(!Sha256::Hash::valid_string("abc"));
	assert(!Sha256::Hash());

	return 0;
}
