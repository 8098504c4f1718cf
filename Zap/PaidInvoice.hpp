#ifndef ZAP_PAIDINVOICE_HPP
#define ZAP_PAIDINVOICE_HPP

#include"Ln/Amount.hpp"
#include"Ln/Preimage.hpp"
#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<stdexcept>
#include<string>

namespace Jsmn { class Object; }

namespace Zap {

/* Thrown when a `waitanyinvoice` result lacks the
 * fields needed to move the cursor.  */
class InvoiceError : public Util::BacktraceException<std::runtime_error> {
public:
	explicit
	InvoiceError(std::string const& msg)
		: Util::BacktraceException<std::runtime_error>(
			"waitanyinvoice result: " + msg
		  ) { }
};

/** struct Zap::PaidInvoice
 *
 * @brief the facts about one settled invoice that
 * the receipt needs.
 */
struct PaidInvoice {
	std::uint64_t pay_index;
	std::string status;
	/* `amount_received_msat`, else `amount_msat`,
	 * else zero.  */
	Ln::Amount amount;
	bool has_requested_amount;
	Ln::Amount requested_amount;
	/* Empty if the invoice had none.  */
	std::string description;
	std::string bolt11;
	std::string label;
	/* Unset if not reported.  */
	Ln::Preimage preimage;

	PaidInvoice()
		: pay_index(0)
		, has_requested_amount(false)
		{ }

	/* Throws InvoiceError if `pay_index` is missing or
	 * any present field is mistyped.  */
	static
	PaidInvoice parse(Jsmn::Object const& result);

	bool is_paid() const { return status == "paid"; }
};

}

#endif /* !defined(ZAP_PAIDINVOICE_HPP) */
