#ifndef ZAP_MSG_COMMANDRESPONSE_HPP
#define ZAP_MSG_COMMANDRESPONSE_HPP

#include"Json/Out.hpp"
#include"Ln/CommandId.hpp"

namespace Zap { namespace Msg {

/** struct Zap::Msg::CommandResponse
 *
 * @brief emit in response to a Zap::Msg::CommandRequest.
 * Responses to unknown or already-answered ids are
 * ignored.
 */
struct CommandResponse {
	Ln::CommandId id;
	Json::Out response;
};

}}

#endif /* !defined(ZAP_MSG_COMMANDRESPONSE_HPP) */
