#ifndef ZAP_BUILD_RECEIPT_HPP
#define ZAP_BUILD_RECEIPT_HPP

#include"Nostr/Event.hpp"
#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<stdexcept>
#include<string>

namespace Secp256k1 { class PrivKey; }
namespace Secp256k1 { class Random; }
namespace Zap { struct PaidInvoice; }

namespace Zap {

/* Thrown when the operator key cannot sign a receipt.  */
class SigningFailure : public Util::BacktraceException<std::runtime_error> {
public:
	explicit
	SigningFailure(std::string const& msg)
		: Util::BacktraceException<std::runtime_error>(
			"Signing failure: " + msg
		  ) { }
};

/** Zap::build_receipt
 *
 * @brief builds and signs the kind 9735 receipt for
 * a validated zap request.
 *
 * @desc Tags, in order: the request's `p`, `e`, `a` and
 * `relays` tags, `P` with the sender key, `bolt11`,
 * `description` holding the invoice description exactly
 * as the node reported it, and `preimage` if the invoice
 * reported one.  Throws SigningFailure if signing fails.
 * The invoice must have a bolt11; callers check first.
 */
Nostr::Event build_receipt( Nostr::Event const& request
			  , Zap::PaidInvoice const& invoice
			  , Secp256k1::PrivKey const& key
			  , Secp256k1::Random& random
			  , std::uint64_t created_at
			  , std::string const& comment
			  );

}

#endif /* !defined(ZAP_BUILD_RECEIPT_HPP) */
