#ifndef ZAP_MSG_COMMANDREQUEST_HPP
#define ZAP_MSG_COMMANDREQUEST_HPP

#include"Jsmn/Object.hpp"
#include"Ln/CommandId.hpp"
#include<string>

namespace Zap { namespace Msg {

/** struct Zap::Msg::CommandRequest
 *
 * @brief emitted whenever a command is received on
 * stdin.
 * Respond by Zap::Msg::CommandResponse or
 * Zap::Msg::CommandFail.
 */
struct CommandRequest {
	std::string command;
	Jsmn::Object params;
	Ln::CommandId id;
};

}}

#endif /* !defined(ZAP_MSG_COMMANDREQUEST_HPP) */
