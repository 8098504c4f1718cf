#include"Secp256k1/Random.hpp"
#include"Util/BacktraceException.hpp"
#include"Util/make_unique.hpp"
#include<sodium/core.h>
#include<sodium/randombytes.h>
#include<sodium/utils.h>
#include<stdexcept>

namespace Secp256k1 {

class Random::Impl {
private:
	std::size_t used;
	std::uint8_t pool[64];

public:
	Impl() : used(sizeof(pool)) {
		if (sodium_init() < 0)
			throw Util::BacktraceException<std::runtime_error>(
				"Secp256k1::Random: sodium_init failed"
			);
	}
	~Impl() {
		sodium_memzero(pool, sizeof(pool));
	}

	std::uint8_t get() {
		if (used >= sizeof(pool)) {
			randombytes_buf(pool, sizeof(pool));
			used = 0;
		}
		return pool[used++];
	}
};

Random::Random() : pimpl(Util::make_unique<Impl>()) { }
Random::~Random() { }

std::uint8_t Random::get() {
	return pimpl->get();
}
void Random::fill(void* p, std::size_t size) {
	/* Bulk requests bypass the pool.  */
	randombytes_buf(p, size);
}

}
