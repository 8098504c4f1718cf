#ifndef EV_THREADPOOL_HPP
#define EV_THREADPOOL_HPP

#include"Ev/Io.hpp"
#include<cstddef>
#include<functional>
#include<memory>

namespace Ev {

/** class Ev::ThreadPool
 *
 * @brief runs blocking calls (disk syncs, socket I/O
 * to relays) off the main thread, so the event loop
 * stays responsive while they complete.
 *
 * @desc Each job is a function run in a background
 * thread; its result (or exception) is handed back to
 * the greenthread that submitted it on the main thread.
 */
class ThreadPool {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

	/* Work is a function of type () -> () -> ();
	 * the outer call runs in the background, the
	 * returned function runs on the main thread.
	 */
	void add(std::function<std::function<void()>()>);

public:
	explicit
	ThreadPool(std::size_t num_threads = 8);
	~ThreadPool();
	ThreadPool(ThreadPool const&) =delete;
	ThreadPool(ThreadPool&&) =delete;

	template<typename a>
	Ev::Io<a> background(std::function<a()> func) {
		auto funptr = std::make_shared<std::function<a()>>(
			std::move(func)
		);
		return Ev::Io<a>([ funptr
				 , this
				 ]( std::function<void(a)> pass
				  , std::function<void(std::exception_ptr)> fail
				  ) {
			add([funptr, pass, fail]() {
				try {
					auto res = std::make_shared<a>((*funptr)());
					return std::function<void()>([pass, res]() {
						pass(std::move(*res));
					});
				} catch (...) {
					auto e = std::current_exception();
					return std::function<void()>([fail, e]() {
						fail(e);
					});
				}
			});
		});
	}
};

}

#endif /* !defined(EV_THREADPOOL_HPP) */
