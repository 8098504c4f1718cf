#ifndef ZAP_MSG_MANIFESTNOTIFICATION_HPP
#define ZAP_MSG_MANIFESTNOTIFICATION_HPP

#include<string>

namespace Zap { namespace Msg {

/** struct Zap::Msg::ManifestNotification
 *
 * @brief emitted while handling a Zap::Msg::Manifestation
 * in order to subscribe to a lightningd notification.
 */
struct ManifestNotification {
	std::string name;
};

}}

#endif /* !defined(ZAP_MSG_MANIFESTNOTIFICATION_HPP) */
