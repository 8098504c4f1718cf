#ifndef ZAP_MOD_PAYMENTWATCHER_HPP
#define ZAP_MOD_PAYMENTWATCHER_HPP

#include<memory>

namespace Ev { class ThreadPool; }
namespace S { class Bus; }
namespace Zap { namespace Mod { class Waiter; }}

namespace Zap { namespace Mod {

/** class Zap::Mod::PaymentWatcher
 *
 * @brief runs the Zap::Watcher payment loop against
 * the node once `init` is done, and reports its state
 * to `clzap-status`.
 *
 * @desc The cursor is read while handling `init`, so a
 * corrupt cursor file makes `init` fail.
 */
class PaymentWatcher {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	PaymentWatcher() =delete;
	PaymentWatcher( S::Bus& bus
		      , Ev::ThreadPool& threadpool
		      , Zap::Mod::Waiter& waiter
		      );
	PaymentWatcher(PaymentWatcher&&);
	~PaymentWatcher();
};

}}

#endif /* !defined(ZAP_MOD_PAYMENTWATCHER_HPP) */
