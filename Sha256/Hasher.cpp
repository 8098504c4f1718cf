#include"Sha256/Hash.hpp"
#include"Sha256/Hasher.hpp"
#include"Util/make_unique.hpp"
#include<sodium/crypto_hash_sha256.h>
#include<sodium/utils.h>

namespace Sha256 {

class Hasher::Impl {
public:
	crypto_hash_sha256_state state;

	Impl() {
		crypto_hash_sha256_init(&state);
	}
	~Impl() {
		sodium_memzero(&state, sizeof(state));
	}
};

Hasher::Hasher() : pimpl(Util::make_unique<Impl>()) { }
Hasher::Hasher(Hasher&& o) : pimpl(std::move(o.pimpl)) { }
Hasher::~Hasher() { }

Hasher& Hasher::operator=(Hasher&& o) {
	pimpl = std::move(o.pimpl);
	return *this;
}

void Hasher::feed(void const* p, std::size_t size) {
	crypto_hash_sha256_update( &pimpl->state
				 , (unsigned char const*) p
				 , (unsigned long long) size
				 );
}

Sha256::Hash Hasher::finalize()&& {
	std::uint8_t out[32];
	crypto_hash_sha256_final(&pimpl->state, out);
	pimpl = nullptr;

	auto rv = Sha256::Hash();
	rv.from_buffer(out);
	return rv;
}

}
