#ifndef ZAP_MSG_PROVIDESTATUS_HPP
#define ZAP_MSG_PROVIDESTATUS_HPP

#include"Json/Out.hpp"
#include<string>

namespace Zap { namespace Msg {

/** struct Zap::Msg::ProvideStatus
 *
 * @brief emitted by modules in response to
 * `Zap::Msg::SolicitStatus` in order to
 * report their status.
 */
struct ProvideStatus {
	/* Field name to use in the status response.  */
	std::string key;
	/* Content of the field.  */
	Json::Out value;
};

}}

#endif /* !defined(ZAP_MSG_PROVIDESTATUS_HPP) */
