#ifndef ZAP_MSG_BEGIN_HPP
#define ZAP_MSG_BEGIN_HPP

namespace Zap { namespace Msg {

/** struct Zap::Msg::Begin
 *
 * @brief emitted once all modules are constructed,
 * before any input is read.
 */
struct Begin { };

}}

#endif /* !defined(ZAP_MSG_BEGIN_HPP) */
