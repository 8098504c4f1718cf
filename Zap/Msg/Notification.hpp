#ifndef ZAP_MSG_NOTIFICATION_HPP
#define ZAP_MSG_NOTIFICATION_HPP

#include"Jsmn/Object.hpp"
#include<string>

namespace Zap { namespace Msg {

/** struct Zap::Msg::Notification
 *
 * @brief emitted whenever a notification is
 * received on stdin.
 */
struct Notification {
	std::string notification;
	Jsmn::Object params;
};

}}

#endif /* !defined(ZAP_MSG_NOTIFICATION_HPP) */
