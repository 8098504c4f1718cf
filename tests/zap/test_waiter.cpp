#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/now.hpp"
#include"Ev/start.hpp"
#include"S/Bus.hpp"
#include"Zap/Mod/Waiter.hpp"
#include"Zap/Shutdown.hpp"
#include<assert.h>
#include<memory>

int main() {
	auto bus = S::Bus();
	auto waiter = Zap::Mod::Waiter(bus);
	auto interrupted = std::make_shared<bool>(false);

	auto code = Ev::lift().then([&]() {
		auto start = Ev::now();
		return waiter.wait(0.05).then([start]() {
			assert(Ev::now() - start >= 0.04);
			return Ev::lift();
		});
	}).then([&]() {
		/* A long wait is cut short by shutdown.  */
		auto longwait = waiter.wait(3600).then([]() {
			assert(0);
			return Ev::lift();
		}).catching<Zap::Shutdown>([interrupted](Zap::Shutdown const&) {
			*interrupted = true;
			return Ev::lift();
		});
		return Ev::concurrent(longwait).then([&]() {
			return waiter.wait(0.01);
		}).then([&]() {
			return bus.raise(Zap::Shutdown());
		});
	}).then([&]() {
		assert(*interrupted);
		/* Later waits fail immediately.  */
		return waiter.wait(0.01).then([]() {
			return Ev::lift(1);
		}).catching<Zap::Shutdown>([](Zap::Shutdown const&) {
			return Ev::lift(0);
		});
	});

	return Ev::start(code);
}
