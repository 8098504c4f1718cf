#include"Secp256k1/PrivKey.hpp"
#include"Secp256k1/Random.hpp"
#include"Zap/PaidInvoice.hpp"
#include"Zap/build_receipt.hpp"
#include<stdexcept>

namespace {

auto constexpr zap_receipt_kind = std::uint32_t(9735);

}

namespace Zap {

Nostr::Event build_receipt( Nostr::Event const& request
			  , Zap::PaidInvoice const& invoice
			  , Secp256k1::PrivKey const& key
			  , Secp256k1::Random& random
			  , std::uint64_t created_at
			  , std::string const& comment
			  ) {
	if (invoice.bolt11.empty())
		throw std::invalid_argument( "Zap::build_receipt: invoice "
					   + std::to_string(invoice.pay_index)
					   + " has no bolt11"
					   );

	auto rv = Nostr::Event();
	rv.kind = zap_receipt_kind;
	rv.created_at = created_at;
	rv.content = comment;

	for (auto name : {"p", "e", "a", "relays"})
		for (auto& t : request.tags_named(name))
			rv.tags.push_back(std::move(t));
	rv.tags.push_back({"P", request.pubkey});
	rv.tags.push_back({"bolt11", invoice.bolt11});
	/* Verbatim, so it hashes to the bolt11 description
	 * hash.  */
	rv.tags.push_back({"description", invoice.description});
	if (invoice.preimage)
		rv.tags.push_back({"preimage", std::string(invoice.preimage)});

	try {
		rv.sign(key, random);
	} catch (Secp256k1::InvalidPrivKey const& e) {
		throw SigningFailure(e.what());
	}
	if (!rv.verify())
		throw SigningFailure("receipt does not verify");
	return rv;
}

}
