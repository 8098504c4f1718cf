#undef NDEBUG
#include"Jsmn/Object.hpp"
#include"Ln/Amount.hpp"
#include"Nostr/Event.hpp"
#include"Secp256k1/PrivKey.hpp"
#include"Secp256k1/Random.hpp"
#include"Zap/validate_zap_request.hpp"
#include"zap/vectors.hpp"
#include<assert.h>
#include<string>

namespace {

auto const recipient = std::string(Vectors::zap_recipient);
auto const note = std::string(64, 'e');

Secp256k1::Random rng;
auto const key = Secp256k1::PrivKey(std::string(Vectors::secret_key));

Nostr::Event request(std::vector<Nostr::Tag> tags, std::uint32_t kind = 9734) {
	auto ev = Nostr::Event();
	ev.created_at = 1700000000;
	ev.kind = kind;
	ev.tags = std::move(tags);
	ev.sign(key, rng);
	return ev;
}

Zap::Validation::Kind check(Nostr::Event const& ev, std::uint64_t msat) {
	return Zap::validate_zap_request(ev, Ln::Amount::msat(msat)).kind;
}

}

int main() {
	using Zap::Validation;

	{
		auto ev = Nostr::Event::parse(
			Jsmn::Object::parse_json(Vectors::zap_request)
		);
		assert(check(ev, 50000) == Validation::Valid);

		/* The invoice was for 5000msat but 50000msat was received.  */
		auto v = Zap::validate_zap_request(ev, Ln::Amount::msat(5000));
		assert(v.kind == Validation::AmountMismatch);
		assert(v.reason.find("50000") != std::string::npos);

		/* Forged content.  */
		auto forged = ev;
		forged.content = "pay me";
		assert(check(forged, 50000) == Validation::InvalidRequest);

		/* Re-signed by someone else with a stale id.  */
		forged = ev;
		forged.pubkey = Vectors::public_key;
		assert(check(forged, 50000) == Validation::InvalidRequest);
	}

	/* Without an amount tag any amount will do.  */
	assert(check(request({{"p", recipient}}), 1) == Validation::Valid);
	assert(check(request({{"p", recipient}, {"e", note}}), 1) == Validation::Valid);
	assert(check(request({{"p", recipient}, {"amount", "4000"}}), 4000) == Validation::Valid);
	assert(check(request({{"p", recipient}, {"amount", "4000"}}), 5000) == Validation::AmountMismatch);

	/* Amount is checked before the rest of the structure.  */
	assert(check(request({{"amount", "4000"}}, 1), 5000) == Validation::AmountMismatch);

	assert(check(request({{"p", recipient}, {"amount", "4k"}}), 4000) == Validation::InvalidRequest);
	assert(check(request({{"p", recipient}, {"amount"}}), 4000) == Validation::InvalidRequest);
	assert(check(request({{"p", recipient}, {"amount", "1"}, {"amount", "1"}}), 1) == Validation::InvalidRequest);

	assert(check(request({{"p", recipient}}, 1), 1) == Validation::InvalidRequest);
	assert(check(request({{"p", recipient}}, 9735), 1) == Validation::InvalidRequest);
	assert(check(request({}), 1) == Validation::InvalidRequest);
	assert(check(request({{"p", recipient}, {"p", recipient}}), 1) == Validation::InvalidRequest);
	assert(check(request({{"p"}}), 1) == Validation::InvalidRequest);
	assert(check(request({{"p", "npub1"}}), 1) == Validation::InvalidRequest);
	assert(check(request({{"p", std::string(64, 'A')}}), 1) == Validation::InvalidRequest);
	assert(check(request({{"p", recipient}, {"e", note}, {"e", note}}), 1) == Validation::InvalidRequest);
	assert(check(request({{"p", recipient}, {"e", "short"}}), 1) == Validation::InvalidRequest);

	return 0;
}
