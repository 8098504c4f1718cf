#ifndef ZAP_MSG_SOLICITSTATUS_HPP
#define ZAP_MSG_SOLICITSTATUS_HPP

namespace Zap { namespace Msg {

/** struct Zap::Msg::SolicitStatus
 *
 * @brief emitted whenever the user issues a
 * `clzap-status` command.
 * Modules should respond synchronously with
 * `Zap::Msg::ProvideStatus` messages.
 */
struct SolicitStatus {};

}}

#endif /* !defined(ZAP_MSG_SOLICITSTATUS_HPP) */
