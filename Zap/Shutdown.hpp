#ifndef ZAP_SHUTDOWN_HPP
#define ZAP_SHUTDOWN_HPP

namespace Zap {

/** struct Zap::Shutdown
 *
 * @brief message raised when the plugin is about to
 * stop, and the exception that waiting Ev::Io
 * operations fail with afterwards.
 */
struct Shutdown {};

}

#endif /* !defined(ZAP_SHUTDOWN_HPP) */
