#ifndef ZAP_MSG_PAYMENTHANDLED_HPP
#define ZAP_MSG_PAYMENTHANDLED_HPP

#include<cstddef>
#include<cstdint>
#include<string>

namespace Zap { namespace Msg {

/** struct Zap::Msg::PaymentHandled
 *
 * @brief emitted after the cursor moved past a
 * payment.
 *
 * @desc `outcome` is one of `not_a_zap`,
 * `invalid_request`, `amount_mismatch`, `published`
 * or `given_up`.  Ids are empty when not applicable.
 */
struct PaymentHandled {
	std::uint64_t pay_index;
	std::string outcome;
	std::string request_id;
	std::string receipt_id;
	std::size_t accepted_relays;
	std::size_t attempted_relays;
	double timestamp;
};

}}

#endif /* !defined(ZAP_MSG_PAYMENTHANDLED_HPP) */
