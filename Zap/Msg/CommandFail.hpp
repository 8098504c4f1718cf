#ifndef ZAP_MSG_COMMANDFAIL_HPP
#define ZAP_MSG_COMMANDFAIL_HPP

#include"Json/Out.hpp"
#include"Ln/CommandId.hpp"
#include<string>

namespace Zap { namespace Msg {

/** struct Zap::Msg::CommandFail
 *
 * @brief emit in response to a Zap::Msg::CommandRequest
 * to indicate that the command failed.
 */
struct CommandFail {
	Ln::CommandId id;
	int code;
	std::string message;
	Json::Out data;
};

}}

#endif /* !defined(ZAP_MSG_COMMANDFAIL_HPP) */
