#include"S/Bus.hpp"
#include"Util/make_unique.hpp"
#include<unordered_map>

namespace S {

class Bus::Impl {
public:
	std::unordered_map< std::type_index
			  , std::unique_ptr<S::Detail::SignalBase>
			  > signals;
};

Bus::Bus() : pimpl(Util::make_unique<Impl>()) { }
Bus::Bus(Bus&& o) : pimpl(std::move(o.pimpl)) { }
Bus::~Bus() { }

S::Detail::SignalBase&
Bus::get_signal( std::type_index type
	       , std::unique_ptr<S::Detail::SignalBase> (*make)()
	       ) {
	auto it = pimpl->signals.find(type);
	if (it == pimpl->signals.end())
		it = pimpl->signals.emplace(type, make()).first;
	return *it->second;
}

}
