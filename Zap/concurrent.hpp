#ifndef ZAP_CONCURRENT_HPP
#define ZAP_CONCURRENT_HPP

namespace Ev { template<typename a> class Io; }

namespace Zap {

/** Zap::concurrent.
 *
 * @brief Like Ev::concurrent except it ignores
 * Zap::Shutdown exceptions in the new greenthread.
 */
Ev::Io<void> concurrent(Ev::Io<void>);

}

#endif /* !defined(ZAP_CONCURRENT_HPP) */
