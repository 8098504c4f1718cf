#ifndef ZAP_MSG_EXIT_HPP
#define ZAP_MSG_EXIT_HPP

#include<string>

namespace Zap { namespace Msg {

/** struct Zap::Msg::Exit
 *
 * @brief emit to terminate the plugin without
 * waiting for stdin to close.
 *
 * @desc Used for startup errors (bad configuration,
 * corrupt cursor) and the `shutdown` notification.
 */
struct Exit {
	int code;
	std::string reason;
};

}}

#endif /* !defined(ZAP_MSG_EXIT_HPP) */
