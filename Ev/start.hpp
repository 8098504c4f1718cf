#ifndef EV_START_HPP
#define EV_START_HPP

namespace Ev { template<typename a> class Io; }

namespace Ev {

/** Ev::start
 *
 * @brief runs the main loop with the given action
 * as the first greenthread, returning the exit code
 * that action yields once all watchers have stopped.
 *
 * @desc An action that fails with an exception has
 * the exception printed to stderr and gives exit
 * code 254.
 */
int start(Ev::Io<int> main);

}

#endif /* !defined(EV_START_HPP) */
