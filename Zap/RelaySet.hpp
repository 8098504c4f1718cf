#ifndef ZAP_RELAYSET_HPP
#define ZAP_RELAYSET_HPP

#include<string>
#include<vector>

namespace Zap {

struct RelayTarget {
	std::string url;
	/* True for operator-configured relays, false for
	 * hints taken from a zap request.  */
	bool configured;
};

/** Zap::normalize_relay
 *
 * @brief trims whitespace and one trailing `/`.
 *
 * @desc Returns the empty string unless the result is
 * a `ws://` or `wss://` URL with a host part.  The
 * scheme is lowercased.
 */
std::string normalize_relay(std::string const& url);

/** Zap::relay_set
 *
 * @brief the relays a receipt goes to: configured
 * relays first, then the hints, without duplicates.
 *
 * @desc Unusable entries are dropped.  A hint equal to
 * a configured relay stays marked as configured.
 */
std::vector<RelayTarget>
relay_set( std::vector<std::string> const& configured
	 , std::vector<std::string> const& hints
	 );

}

#endif /* !defined(ZAP_RELAYSET_HPP) */
