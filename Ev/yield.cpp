#include"Ev/Io.hpp"
#include"Ev/yield.hpp"
#include"Util/make_unique.hpp"
#include<ev.h>

namespace {

struct YieldPoint {
	ev_idle idler;
	std::function<void()> pass;
};

void yield_handler(EV_P_ ev_idle* raw_idler, int) {
	/* Take the yield point back from C.  */
	auto point = std::unique_ptr<YieldPoint>((YieldPoint*) raw_idler->data);
	ev_idle_stop(EV_A_ &point->idler);

	auto pass = std::move(point->pass);
	point = nullptr;

	pass();
}

}

namespace Ev {

Io<void> yield() {
	return Io<void>([]( std::function<void()> pass
			  , std::function<void(std::exception_ptr)>
			  ) {
		auto point = Util::make_unique<YieldPoint>();
		point->pass = std::move(pass);
		ev_idle_init(&point->idler, &yield_handler);
		point->idler.data = point.get();
		ev_idle_start(EV_DEFAULT_ &point.release()->idler);
	});
}

}
