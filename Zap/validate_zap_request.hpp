#ifndef ZAP_VALIDATE_ZAP_REQUEST_HPP
#define ZAP_VALIDATE_ZAP_REQUEST_HPP

#include<string>

namespace Ln { class Amount; }
namespace Nostr { struct Event; }

namespace Zap {

struct Validation {
	enum Kind {
		Valid,
		InvalidRequest,
		AmountMismatch
	};
	Kind kind;
	std::string reason;
};

/** Zap::validate_zap_request
 *
 * @brief checks a zap request against NIP-57 and the
 * amount actually paid.
 *
 * @desc Checks run in this order and stop at the
 * first failure: id and signature, then the `amount`
 * tag against `paid`, then kind 9734 with exactly one
 * `p` tag and at most one `e` tag, both holding 64
 * lowercase hex digits.
 */
Validation validate_zap_request( Nostr::Event const& request
			       , Ln::Amount const& paid
			       );

}

#endif /* !defined(ZAP_VALIDATE_ZAP_REQUEST_HPP) */
