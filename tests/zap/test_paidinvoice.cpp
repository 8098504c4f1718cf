#undef NDEBUG
#include"Jsmn/Object.hpp"
#include"Zap/PaidInvoice.hpp"
#include<assert.h>
#include<string>

namespace {

bool bad(std::string const& json) {
	try {
		Zap::PaidInvoice::parse(Jsmn::Object::parse_json(json));
	} catch (Zap::InvoiceError const&) {
		return true;
	}
	return false;
}

}

int main() {
	{
		auto inv = Zap::PaidInvoice::parse(Jsmn::Object::parse_json(R"JSON(
		{ "label": "zap-1"
		, "bolt11": "lnbc1"
		, "payment_hash": "83f34c56502833b28dc64b382ef8462c2f5edb19c427fd5456d46bfc5c35914b"
		, "amount_msat": 5000
		, "status": "paid"
		, "pay_index": 12
		, "amount_received_msat": 50000
		, "paid_at": 1687251840
		, "payment_preimage": "0000000000000000000000000000000000000000000000000000000000000001"
		, "description": "{\"kind\":9734}"
		, "expires_at": 1687338240
		}
		)JSON"));
		assert(inv.pay_index == 12);
		assert(inv.is_paid());
		/* The amount received wins.  */
		assert(inv.amount == Ln::Amount::msat(50000));
		assert(inv.has_requested_amount);
		assert(inv.requested_amount == Ln::Amount::msat(5000));
		assert(inv.description == "{\"kind\":9734}");
		assert(inv.bolt11 == "lnbc1");
		assert(inv.label == "zap-1");
		assert(inv.preimage);
		assert( std::string(inv.preimage)
		     == "0000000000000000000000000000000000000000000000000000000000000001"
		      );
	}
	{
		/* Older lightningd, string amounts, no preimage.  */
		auto inv = Zap::PaidInvoice::parse(Jsmn::Object::parse_json(R"JSON(
		{"status": "paid", "pay_index": 3, "amount_msat": "2000msat"}
		)JSON"));
		assert(inv.amount == Ln::Amount::msat(2000));
		assert(!inv.preimage);
		assert(inv.description == "");
		assert(inv.bolt11 == "");
	}
	{
		/* "any" invoice without amount fields.  */
		auto inv = Zap::PaidInvoice::parse(Jsmn::Object::parse_json(R"JSON(
		{"status": "expired", "pay_index": 4}
		)JSON"));
		assert(!inv.is_paid());
		assert(!inv.has_requested_amount);
		assert(inv.amount == Ln::Amount::msat(0));
	}

	assert(bad("[]"));
	assert(bad(R"({"status": "paid"})"));
	assert(bad(R"({"pay_index": "3"})"));
	assert(bad(R"({"pay_index": -3})"));
	assert(bad(R"({"pay_index": 3.5})"));
	assert(bad(R"({"pay_index": 3, "description": 7})"));
	assert(bad(R"({"pay_index": 3, "amount_msat": "lots"})"));
	assert(bad(R"({"pay_index": 3, "payment_preimage": "00"})"));

	return 0;
}
