#include"Ev/Io.hpp"
#include"Ev/ThreadPool.hpp"
#include"Jsmn/Object.hpp"
#include"S/Bus.hpp"
#include"Util/make_unique.hpp"
#include"Zap/JsonInput.hpp"
#include"Zap/Msg/JsonCin.hpp"

namespace Zap {

class JsonInput::Impl {
private:
	Ev::ThreadPool& threadpool;
	std::istream& cin;
	S::Bus& bus;

public:
	Impl( Ev::ThreadPool& threadpool_
	    , std::istream& cin_
	    , S::Bus& bus_
	    ) : threadpool(threadpool_)
	      , cin(cin_)
	      , bus(bus_)
	      { }

	Ev::Io<void> run() {
		typedef std::shared_ptr<Jsmn::Object> PObj;
		return threadpool.background<PObj>([this]() {
			auto obj = Jsmn::Object();
			cin >> std::ws;
			if (!cin || cin.eof())
				return PObj();
			cin >> obj;
			if (!cin)
				return PObj();
			return std::make_shared<Jsmn::Object>(std::move(obj));
		}).then([this](PObj pobj) {
			if (!pobj)
				/* Exit loop.  */
				return Ev::lift();

			return bus.raise(Zap::Msg::JsonCin{
				std::move(*pobj)
			}).then([this]() {
				return run();
			});
		});
	}
};

JsonInput::JsonInput( Ev::ThreadPool& threadpool
		    , std::istream& cin
		    , S::Bus& bus
		    ) : pimpl(Util::make_unique<Impl>(threadpool, cin, bus)) { }
JsonInput::JsonInput(JsonInput&& o) : pimpl(std::move(o.pimpl)) { }
JsonInput::~JsonInput() { }

Ev::Io<void> JsonInput::run() {
	return pimpl->run();
}

}
