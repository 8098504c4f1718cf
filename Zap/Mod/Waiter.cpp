#include"Ev/Io.hpp"
#include"S/Bus.hpp"
#include"Util/make_unique.hpp"
#include"Zap/Mod/Waiter.hpp"
#include"Zap/Shutdown.hpp"
#include<ev.h>
#include<list>

namespace Zap { namespace Mod {

class Waiter::Impl {
private:
	bool is_shutting_down;

	struct Timer {
		ev_timer timer;
		Impl* self;
		std::function<void()> pass;
		std::function<void(std::exception_ptr)> fail;
		std::list<Timer>::iterator it;
	};
	std::list<Timer> timers;

	static
	void fail_shutdown(std::function<void(std::exception_ptr)> const& fail) {
		try {
			throw Zap::Shutdown();
		} catch (...) {
			fail(std::current_exception());
		}
	}

	void shutdown() {
		is_shutting_down = true;
		auto timers_copy = std::move(timers);
		timers.clear();
		for (auto& t : timers_copy) {
			ev_timer_stop(EV_DEFAULT_ &t.timer);
			fail_shutdown(t.fail);
		}
	}

	static
	void on_timer(EV_P_ ev_timer* timer, int) {
		auto t = reinterpret_cast<Timer*>(timer->data);
		ev_timer_stop(EV_A_ timer);
		auto pass = std::move(t->pass);
		/* Destroys `t`.  */
		t->self->timers.erase(t->it);
		pass();
	}

public:
	explicit
	Impl(S::Bus& bus) : is_shutting_down(false) {
		bus.subscribe<Zap::Shutdown>([this](Zap::Shutdown const&) {
			shutdown();
			return Ev::lift();
		});
	}
	~Impl() {
		for (auto& t : timers)
			ev_timer_stop(EV_DEFAULT_ &t.timer);
	}

	Ev::Io<void> wait(double seconds) {
		return Ev::Io<void>([ this
				    , seconds
				    ]( std::function<void()> pass
				     , std::function<void(std::exception_ptr)> fail
				     ) {
			if (is_shutting_down)
				return fail_shutdown(fail);

			auto it = timers.emplace(timers.begin());
			it->self = this;
			it->pass = std::move(pass);
			it->fail = std::move(fail);
			it->it = it;
			ev_timer_init(&it->timer, &on_timer, seconds, 0);
			it->timer.data = &*it;
			ev_timer_start(EV_DEFAULT_ &it->timer);
		});
	}
};

Waiter::Waiter(S::Bus& bus) : pimpl(Util::make_unique<Impl>(bus)) {}
Waiter::~Waiter() { }

Ev::Io<void> Waiter::wait(double seconds) {
	return pimpl->wait(seconds);
}

}}
