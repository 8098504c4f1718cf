#include"Ev/Io.hpp"
#include"Ev/yield.hpp"
#include"S/Bus.hpp"
#include"Zap/Mod/JsonOutputter.hpp"
#include"Zap/Msg/JsonCout.hpp"
#include"Zap/concurrent.hpp"

namespace Zap { namespace Mod {

JsonOutputter::JsonOutputter( std::ostream& cout_
			    , S::Bus& bus
			    ) : cout(cout_) {
	bus.subscribe<Zap::Msg::JsonCout>([this](Zap::Msg::JsonCout const& j) {
		auto idle = outs.empty();
		outs.push(j.obj.output());
		/* A drain is already scheduled.  */
		if (!idle)
			return Ev::lift();
		return Zap::concurrent(drain());
	});
}

Ev::Io<void> JsonOutputter::drain() {
	return Ev::yield().then([this]() {
		if (outs.empty())
			return Ev::lift();
		/* lightningd wants a blank line between messages.  */
		cout << outs.front() << "\n\n";
		cout.flush();
		outs.pop();
		return drain();
	});
}

}}
