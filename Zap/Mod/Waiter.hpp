#ifndef ZAP_MOD_WAITER_HPP
#define ZAP_MOD_WAITER_HPP

#include<memory>

namespace Ev { template<typename a> class Io;}
namespace S { class Bus; }

namespace Zap { namespace Mod {

/** class Zap::Mod::Waiter
 *
 * @brief timers on the libev loop.
 */
class Waiter {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	explicit
	Waiter(S::Bus& bus);
	~Waiter();

	/** Zap::Mod::Waiter::wait
	 *
	 * @brief completes after the given number of
	 * seconds.
	 *
	 * @desc Fails with Zap::Shutdown as soon as a
	 * shutdown is raised on the bus, including for
	 * waits started afterwards.
	 */
	Ev::Io<void> wait(double seconds);
};

}}

#endif /* !defined(ZAP_MOD_WAITER_HPP) */
