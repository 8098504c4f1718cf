#undef NDEBUG
#include"Jsmn/Object.hpp"
#include"Nostr/Event.hpp"
#include"Secp256k1/PrivKey.hpp"
#include"Secp256k1/Random.hpp"
#include"Sha256/Hash.hpp"
#include"Sha256/fun.hpp"
#include"Zap/PaidInvoice.hpp"
#include"Zap/build_receipt.hpp"
#include"zap/vectors.hpp"
#include<assert.h>
#include<stdexcept>
#include<string>

int main() {
	auto random = Secp256k1::Random();
	auto key = Secp256k1::PrivKey(std::string(Vectors::secret_key));
	auto raw = std::string(Vectors::zap_request);
	auto request = Nostr::Event::parse(Jsmn::Object::parse_json(raw));

	auto invoice = Zap::PaidInvoice();
	invoice.pay_index = 1;
	invoice.status = "paid";
	invoice.amount = Ln::Amount::msat(50000);
	invoice.description = raw;
	invoice.bolt11 = Vectors::bolt11;
	invoice.label = Vectors::label;

	{
		auto receipt = Zap::build_receipt( request, invoice
						 , key, random
						 , 1687251840, ""
						 );
		assert(receipt.kind == 9735);
		assert(receipt.created_at == 1687251840);
		assert(receipt.content == "");
		assert(receipt.pubkey == Vectors::public_key);
		assert(receipt.verify());

		/* p, e, relays, P, bolt11, description.  */
		assert(receipt.tags.size() == 6);
		assert((receipt.tags[0] == Nostr::Tag{"p", Vectors::zap_recipient}));
		assert(receipt.tags[1][0] == "e");
		assert(receipt.tags[2][0] == "relays");
		assert(receipt.tags[2].size() == 14);
		assert((receipt.tags[3] == Nostr::Tag{"P", Vectors::zap_sender}));
		assert((receipt.tags[4] == Nostr::Tag{"bolt11", Vectors::bolt11}));
		assert((receipt.tags[5] == Nostr::Tag{"description", raw}));
		assert(receipt.tags_named("amount").empty());
		assert(receipt.tags_named("preimage").empty());

		/* The description hashes to the invoice's
		 * description hash.  */
		assert( Sha256::fun(receipt.tags_named("description")[0][1])
		     == Sha256::fun(invoice.description)
		      );
	}

	{
		invoice.preimage = Ln::Preimage(std::string(64, '7'));
		auto receipt = Zap::build_receipt( request, invoice
						 , key, random
						 , 1687251841, "thanks"
						 );
		assert(receipt.content == "thanks");
		auto pre = receipt.tags_named("preimage");
		assert(pre.size() == 1);
		assert(pre[0][1] == std::string(64, '7'));
		assert(receipt.tags.back()[0] == "preimage");
		assert(receipt.verify());
	}

	{
		/* The description tag is the invoice description
		 * as given, not the unwrapped request.  */
		auto padded = invoice;
		padded.description = "\n  " + raw + " \n";
		auto receipt = Zap::build_receipt( request, padded
						 , key, random
						 , 1687251843, ""
						 );
		auto desc = receipt.tags_named("description");
		assert(desc.size() == 1);
		assert(desc[0][1] == padded.description);
		assert(desc[0][1] != raw);
		assert( Sha256::fun(desc[0][1])
		     == Sha256::fun(padded.description)
		      );
		assert(receipt.verify());
	}

	{
		auto encoded = invoice;
		encoded.description = "%7B%22kind%22%3A9734%7D";
		auto receipt = Zap::build_receipt( request, encoded
						 , key, random
						 , 1687251844, ""
						 );
		assert(receipt.tags_named("description")[0][1] == encoded.description);
	}

	{
		invoice.bolt11 = "";
		auto threw = false;
		try {
			Zap::build_receipt( request, invoice
					  , key, random
					  , 1687251842, ""
					  );
		} catch (std::invalid_argument const&) {
			threw = true;
		}
		assert(threw);
	}

	return 0;
}
