#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Util/make_unique.hpp"
#include<ev.h>
#include<iostream>

namespace {

struct Launch {
	ev_idle idler;
	std::unique_ptr<Ev::Io<void>> io;
};

void launch_handler(EV_P_ ev_idle* raw_idler, int) {
	auto launch = std::unique_ptr<Launch>((Launch*) raw_idler->data);
	ev_idle_stop(EV_A_ &launch->idler);

	auto io = std::move(launch->io);
	launch = nullptr;

	io->run([]() { }, [](std::exception_ptr e) {
		try {
			std::rethrow_exception(e);
		} catch (std::exception const& ex) {
			std::cerr << "Unhandled exception in greenthread: "
				  << ex.what()
				  << std::endl;
		} catch (...) {
			std::cerr << "Unhandled exception of unknown type "
				  << "in greenthread"
				  << std::endl;
		}
	});
}

}

namespace Ev {

Ev::Io<void> concurrent(Ev::Io<void> io) {
	return Ev::Io<void>([io]( std::function<void()> pass
				, std::function<void(std::exception_ptr)>
				) {
		auto launch = Util::make_unique<Launch>();
		launch->io = Util::make_unique<Ev::Io<void>>(io);
		ev_idle_init(&launch->idler, &launch_handler);
		launch->idler.data = launch.get();
		ev_idle_start(EV_DEFAULT_ &launch.release()->idler);
		pass();
	});
}

}
