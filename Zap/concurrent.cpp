#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Zap/Shutdown.hpp"
#include"Zap/concurrent.hpp"

namespace Zap {

Ev::Io<void> concurrent(Ev::Io<void> io) {
	return Ev::concurrent(io.catching<Zap::Shutdown>([](Zap::Shutdown const&) {
		return Ev::lift();
	}));
}

}
