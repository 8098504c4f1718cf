#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Util/make_unique.hpp"
#include<ev.h>
#include<iostream>
#include<memory>

namespace {

struct MainContainer {
	int exit_code;
	Ev::Io<int> main;
};

void start_idle_handler(EV_P_ ev_idle *raw_idler, int) {
	/* Take the idler back from C.  */
	auto idler = std::unique_ptr<ev_idle>(raw_idler);
	ev_idle_stop(EV_A_ idler.get());

	auto container = (MainContainer*) idler->data;
	auto main = std::move(container->main);

	main.run([container](int exit_code) {
		container->exit_code = exit_code;
	}, [container](std::exception_ptr e) {
		try {
			std::rethrow_exception(e);
		} catch (std::exception const& ex) {
			std::cerr << "Unhandled exception: "
				  << ex.what()
				  << std::endl;
		} catch (...) {
			std::cerr << "Unhandled exception of unknown type"
				  << std::endl;
		}
		container->exit_code = 254;
	});
}

}

namespace Ev {

int start(Io<int> main) {
	if (!ev_default_loop(0)) {
		std::cerr << "libev failed to initialize" << std::endl;
		return 255;
	}

	auto container = MainContainer{ 255, std::move(main) };

	auto idler = Util::make_unique<ev_idle>();
	ev_idle_init(idler.get(), &start_idle_handler);
	idler->data = &container;
	/* C owns the idler until the handler fires.  */
	ev_idle_start(EV_DEFAULT_ idler.release());

	if (ev_run(EV_DEFAULT_ 0))
		std::cerr << "WARNING: libev watchers still active."
			  << std::endl;

	return container.exit_code;
}

}
