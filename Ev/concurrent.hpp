#ifndef EV_CONCURRENT_HPP
#define EV_CONCURRENT_HPP

namespace Ev { template<typename a> class Io; }

namespace Ev {

/** Ev::concurrent
 *
 * @brief launches the given action as a new greenthread,
 * which starts once the current greenthread yields.
 *
 * @desc The returned action completes immediately.
 * Exceptions escaping the new greenthread are printed
 * to stderr and otherwise ignored, so callers should
 * handle their own errors inside `io`.
 */
Ev::Io<void> concurrent(Ev::Io<void> io);

}

#endif /* !defined(EV_CONCURRENT_HPP) */
