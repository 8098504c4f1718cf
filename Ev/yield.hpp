#ifndef EV_YIELD_HPP
#define EV_YIELD_HPP

namespace Ev { template<typename a> class Io; }

namespace Ev {

/** Ev::yield
 *
 * @brief a yield point: lets other greenthreads run
 * before this one continues.
 *
 * @desc State shared with other greenthreads may have
 * changed by the time the action returns.
 */
Ev::Io<void> yield();

}

#endif /* !defined(EV_YIELD_HPP) */
