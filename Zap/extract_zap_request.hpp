#ifndef ZAP_EXTRACT_ZAP_REQUEST_HPP
#define ZAP_EXTRACT_ZAP_REQUEST_HPP

#include"Nostr/Event.hpp"
#include<string>

namespace Zap {

/** struct Zap::Extraction
 *
 * @brief what an invoice description turned out to
 * contain.
 *
 * @desc `Absent` is ordinary text (or nothing);
 * `Malformed` is JSON that is not a usable event.
 * Both mean the invoice is not a zap.  For `Found`,
 * `raw` is the request JSON text after any unwrapping.
 */
struct Extraction {
	enum Kind {
		Absent,
		Malformed,
		Found
	};
	Kind kind;
	std::string reason;
	Nostr::Event request;
	std::string raw;
};

/** Zap::extract_zap_request
 *
 * @brief recovers the zap request event embedded in
 * an invoice description.
 *
 * @desc Surrounding whitespace, percent-encoding and a
 * JSON string literal wrapping the event are all
 * tolerated.  The event is not verified here.
 */
Extraction extract_zap_request(std::string const& description);

}

#endif /* !defined(ZAP_EXTRACT_ZAP_REQUEST_HPP) */
