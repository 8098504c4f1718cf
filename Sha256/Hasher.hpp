#ifndef SHA256_HASHER_HPP
#define SHA256_HASHER_HPP

#include<cstddef>
#include<memory>

namespace Sha256 { class Hash; }

namespace Sha256 {

/** class Sha256::Hasher
 *
 * @brief incremental SHA-256 over libsodium.
 *
 * @desc Feed the event serialization in any number
 * of pieces, then `finalize` once; the hasher is
 * empty afterwards.
 */
class Hasher {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Hasher();
	Hasher(Hasher&&);
	~Hasher();

	Hasher& operator=(Hasher&&);

	/* False once finalized.  */
	explicit
	operator bool() const { return !!pimpl; }
	bool operator!() const { return !pimpl; }

	void feed(void const* p, std::size_t size);

	Sha256::Hash finalize()&&;
};

}

#endif /* !defined(SHA256_HASHER_HPP) */
