#include"Jsmn/Object.hpp"
#include"Util/Str.hpp"
#include"Zap/PaidInvoice.hpp"

namespace {

std::string opt_string(Jsmn::Object const& js, char const* field) {
	if (!js.has(field))
		return "";
	auto v = js[field];
	if (!v.is_string())
		throw Zap::InvoiceError(std::string(field) + " not string");
	return std::string(v);
}

bool opt_amount( Jsmn::Object const& js, char const* field
	       , Ln::Amount& out
	       ) {
	if (!js.has(field))
		return false;
	try {
		out = Ln::Amount::object(js[field]);
	} catch (std::invalid_argument const&) {
		throw Zap::InvoiceError(std::string(field) + " not an amount");
	}
	return true;
}

}

namespace Zap {

PaidInvoice PaidInvoice::parse(Jsmn::Object const& js) {
	if (!js.is_object())
		throw InvoiceError("not an object");
	if (!js.has("pay_index"))
		throw InvoiceError("no pay_index");

	auto rv = PaidInvoice();

	auto pay_index = js["pay_index"];
	if ( !pay_index.is_number()
	  || !Util::Str::parse_u64(pay_index.direct_text(), rv.pay_index)
	   )
		throw InvoiceError("pay_index not unsigned integer");

	rv.status = opt_string(js, "status");
	rv.description = opt_string(js, "description");
	rv.bolt11 = opt_string(js, "bolt11");
	rv.label = opt_string(js, "label");

	rv.has_requested_amount = opt_amount(js, "amount_msat", rv.requested_amount);
	if (!opt_amount(js, "amount_received_msat", rv.amount)) {
		if (rv.has_requested_amount)
			rv.amount = rv.requested_amount;
	}

	auto preimage = opt_string(js, "payment_preimage");
	if (preimage != "") {
		if (!Ln::Preimage::valid_string(preimage))
			throw InvoiceError("payment_preimage not 32 hex bytes");
		rv.preimage = Ln::Preimage(preimage);
	}

	return rv;
}

}
