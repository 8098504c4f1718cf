#ifndef S_BUS_HPP
#define S_BUS_HPP

#include"S/Detail/Signal.hpp"
#include<functional>
#include<memory>
#include<typeindex>
#include<typeinfo>

namespace S {

/** class S::Bus
 *
 * @brief signal bus for broadcasting messages and
 * subscribing to broadcasts.
 *
 * @desc Modules never call each other directly; they
 * subscribe to message types in their constructors and
 * raise messages for others.
 * `raise` runs every subscriber concurrently and its
 * action completes only once all of them have.
 */
class Bus {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

	S::Detail::SignalBase&
	get_signal( std::type_index type
		  , std::unique_ptr<S::Detail::SignalBase> (*make)()
		  );

	template<typename a>
	static
	std::unique_ptr<S::Detail::SignalBase> make_signal() {
		return std::unique_ptr<S::Detail::SignalBase>(
			new S::Detail::Signal<a>()
		);
	}
	template<typename a>
	S::Detail::Signal<a>& signal() {
		auto& base = get_signal( std::type_index(typeid(a))
				       , &make_signal<a>
				       );
		return static_cast<S::Detail::Signal<a>&>(base);
	}

public:
	Bus();
	Bus(Bus&&);
	~Bus();

	template<typename a>
	void subscribe(std::function<Ev::Io<void>(a const&)> cb) {
		signal<a>().subscribe(std::move(cb));
	}
	template<typename a>
	Ev::Io<void> raise(a value) {
		return signal<a>().raise(std::move(value));
	}
};

}

#endif /* !defined(S_BUS_HPP) */
