#ifndef SECP256K1_DETAIL_CONTEXT_HPP
#define SECP256K1_DETAIL_CONTEXT_HPP

#include<memory>

extern "C" {
struct secp256k1_context_struct;
}

namespace Secp256k1 {
namespace Detail {

/* The process-wide signing/verification context.
 * A shared pointer keeps the opaque struct's deleter out
 * of this header.
 */
extern std::shared_ptr<secp256k1_context_struct> const context;

}
}

#endif /* !defined(SECP256K1_DETAIL_CONTEXT_HPP) */
