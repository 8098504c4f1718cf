#ifndef S_DETAIL_SIGNAL_HPP
#define S_DETAIL_SIGNAL_HPP

#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/yield.hpp"
#include<cstddef>
#include<functional>
#include<memory>
#include<vector>

namespace S { namespace Detail {

/* Type-erased base so the bus can own signals of any type.  */
class SignalBase {
public:
	virtual ~SignalBase() { }
};

/* The subscribers for messages of type a.  */
template<typename a>
class Signal : public SignalBase {
private:
	typedef std::function<Ev::Io<void>(a const&)> Callback;
	std::vector<std::shared_ptr<Callback>> callbacks;

	/* One raise in progress.  Completes when every
	 * subscriber has finished; if any failed, fails with
	 * the last exception seen.
	 */
	struct Raising {
		a value;
		std::size_t running;
		std::exception_ptr exc;
		std::function<void()> pass;
		std::function<void(std::exception_ptr)> fail;

		explicit
		Raising(a value_) : value(std::move(value_)), running(0) { }

		void finish_one() {
			--running;
			if (running != 0)
				return;
			auto my_pass = std::move(pass);
			auto my_fail = std::move(fail);
			if (exc)
				my_fail(exc);
			else
				my_pass();
		}
	};

public:
	/* `a` must be at least movable; messages are
	 * expected to be plain data structures.
	 */
	Ev::Io<void> raise(a value) {
		auto subscribers = callbacks;
		auto r = std::make_shared<Raising>(std::move(value));
		return Ev::Io<void>([ subscribers
				    , r
				    ]( std::function<void()> pass
				     , std::function<void(std::exception_ptr)> fail
				     ) {
			if (subscribers.empty())
				return pass();
			r->pass = std::move(pass);
			r->fail = std::move(fail);
			r->running = subscribers.size();
			for (auto const& cb : subscribers) {
				auto act = Ev::lift().then([cb, r]() {
					return (*cb)(r->value);
				});
				auto track = Ev::Io<void>([ act
							  , r
							  ]( std::function<void()> pass
							   , std::function<void(std::exception_ptr)>
							   ) {
					act.run([r, pass]() {
						pass();
						r->finish_one();
					}, [r, pass](std::exception_ptr e) {
						r->exc = e;
						pass();
						r->finish_one();
					});
				});
				Ev::concurrent(track).run([]() { }, r->fail);
			}
		}).then([]() {
			return Ev::yield();
		});
	}

	void subscribe(Callback cb) {
		if (!cb)
			return;
		callbacks.emplace_back(std::make_shared<Callback>(std::move(cb)));
	}
};

}}

#endif /* !defined(S_DETAIL_SIGNAL_HPP) */
