#include"Ln/Amount.hpp"
#include"Nostr/Event.hpp"
#include"Util/Str.hpp"
#include"Zap/validate_zap_request.hpp"
#include<cstdint>

namespace {

auto constexpr zap_request_kind = std::uint32_t(9734);

Zap::Validation invalid(std::string reason) {
	return Zap::Validation{Zap::Validation::InvalidRequest, std::move(reason)};
}

bool well_formed(Nostr::Tag const& tag) {
	return tag.size() >= 2 && Util::Str::islowerhex(tag[1], 64);
}

}

namespace Zap {

Validation validate_zap_request( Nostr::Event const& request
			       , Ln::Amount const& paid
			       ) {
	if (!request.verify())
		return invalid("bad id or signature");

	auto amounts = request.tags_named("amount");
	if (amounts.size() > 1)
		return invalid("multiple amount tags");
	if (amounts.size() == 1) {
		auto msat = std::uint64_t();
		if ( amounts[0].size() < 2
		  || !Util::Str::parse_u64(amounts[0][1], msat)
		   )
			return invalid("unparsable amount tag");
		if (msat != paid.to_msat())
			return Validation{ Validation::AmountMismatch
					 , "requested " + std::to_string(msat)
					 + "msat, paid "
					 + std::to_string(paid.to_msat())
					 + "msat"
					 };
	}

	if (request.kind != zap_request_kind)
		return invalid("kind " + std::to_string(request.kind));

	auto ps = request.tags_named("p");
	if (ps.size() != 1)
		return invalid(std::to_string(ps.size()) + " p tags");
	if (!well_formed(ps[0]))
		return invalid("malformed p tag");

	auto es = request.tags_named("e");
	if (es.size() > 1)
		return invalid(std::to_string(es.size()) + " e tags");
	if (es.size() == 1 && !well_formed(es[0]))
		return invalid("malformed e tag");

	return Validation{Validation::Valid, ""};
}

}
