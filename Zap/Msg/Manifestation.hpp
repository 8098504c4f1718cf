#ifndef ZAP_MSG_MANIFESTATION_HPP
#define ZAP_MSG_MANIFESTATION_HPP

namespace Zap { namespace Msg {

/** struct Zap::Msg::Manifestation
 *
 * @brief emitted while answering `getmanifest`.
 * Modules respond with ManifestOption,
 * ManifestCommand and ManifestNotification.
 */
struct Manifestation { };

}}

#endif /* !defined(ZAP_MSG_MANIFESTATION_HPP) */
