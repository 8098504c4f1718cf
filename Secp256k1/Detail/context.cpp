#include"Secp256k1/Detail/context.hpp"
#include"Util/BacktraceException.hpp"
#include<secp256k1.h>
#include<stdexcept>
#include<string>

namespace {

/* Called on API misuse by this program (never on bad
 * external data, which is reported via return codes).  */
void illegal_callback(char const* msg, void*) {
	throw Util::BacktraceException<std::invalid_argument>(
		std::string("SECP256K1: ") + msg
	);
}

std::shared_ptr<secp256k1_context_struct> create_context() {
	auto ctx = secp256k1_context_create(SECP256K1_CONTEXT_NONE);
	auto rv = std::shared_ptr<secp256k1_context_struct>(
		ctx, &secp256k1_context_destroy
	);
	secp256k1_context_set_illegal_callback( rv.get()
					      , &illegal_callback
					      , nullptr
					      );
	return rv;
}

}

namespace Secp256k1 {
namespace Detail {

std::shared_ptr<secp256k1_context_struct> const context = create_context();

}
}
