#ifndef ZAP_MSG_ZAPSETTINGS_HPP
#define ZAP_MSG_ZAPSETTINGS_HPP

#include"Secp256k1/PrivKey.hpp"
#include<cstddef>
#include<cstdint>
#include<string>
#include<vector>

namespace Zap { namespace Msg {

/** struct Zap::Msg::ZapSettings
 *
 * @brief the validated plugin configuration,
 * emitted once during `init`.
 */
struct ZapSettings {
	Secp256k1::PrivKey key;
	/* Normalized, deduplicated, never empty.  */
	std::vector<std::string> relays;
	std::uint64_t start_index;
	std::string cursor_path;
	std::size_t publish_retries;
	double publish_backoff;
	double relay_timeout;
	bool strict_relays;
	/* True for `clzap-relay-ack=ok`.  */
	bool wait_ok;
	std::string receipt_comment;
	bool use_request_relays;
	std::size_t stuck_alert_cycles;
	/* 0 means never give up.  */
	std::size_t give_up_cycles;
};

}}

#endif /* !defined(ZAP_MSG_ZAPSETTINGS_HPP) */
