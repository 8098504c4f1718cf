#ifndef EV_IO_HPP
#define EV_IO_HPP

#include<exception>
#include<functional>
#include<memory>
#include<type_traits>
#include<utility>

namespace Ev {

/* Pre-declare for Detail::IoInner.  */
template<typename a>
class Io;

namespace Detail {

/* Given an Io<a>, extract the type a.  */
template<typename t>
struct IoInner;
template<typename a>
struct IoInner<Io<a>> {
	using type = a;
};
/* Given a type a, give the std::function that accepts that type.  */
template<typename a>
struct PassFunc {
	using type = std::function<void(a)>;
};
template<>
struct PassFunc<void> {
	using type = std::function<void()>;
};
typedef std::function<void (std::exception_ptr)> FailFunc;

/* The b in `f :: as -> Io b`.  */
template<typename f, typename... as>
using IoResult = typename IoInner<
	typename std::decay<
		decltype(std::declval<f&>()(std::declval<as>()...))
	>::type
>::type;

/* Base for Io<a>.  */
template<typename a>
class IoBase {
public:
	typedef
	std::function<void ( typename Detail::PassFunc<a>::type
			   , FailFunc
			   )> CoreFunc;

protected:
	CoreFunc core;

	template <typename b>
	friend class Ev::Io;
	template <typename b>
	friend class IoBase;

	/* Runs a core, routing anything it throws synchronously
	 * to the failure continuation.
	 */
	static void invoke( CoreFunc const& c
			  , typename Detail::PassFunc<a>::type pass
			  , FailFunc fail
			  ) {
		try {
			c(std::move(pass), fail);
		} catch (...) {
			fail(std::current_exception());
		}
	}

public:
	IoBase(CoreFunc core_) : core(std::move(core_)) { }

	/** Ev::Io<a>::catching<e>
	 *
	 * @brief If this action fails with an exception of
	 * type e, run the handler action instead.
	 * Other exceptions propagate unchanged.
	 */
	template<typename e>
	Io<a> catching(std::function<Io<a>(e const&)> handler) const {
		auto core_copy = core;
		return Io<a>([ core_copy
			     , handler
			     ]( typename Detail::PassFunc<a>::type pass
			      , FailFunc fail
			      ) {
			auto sub_fail = [ pass, fail
					, handler
					](std::exception_ptr err) {
				auto recovery = std::unique_ptr<Io<a>>();
				try {
					std::rethrow_exception(err);
				} catch (e const& ex) {
					try {
						recovery.reset(new Io<a>(handler(ex)));
					} catch (...) {
						return fail(std::current_exception());
					}
				} catch (...) {
					return fail(std::current_exception());
				}
				invoke(recovery->core, pass, fail);
			};
			invoke(core_copy, pass, sub_fail);
		});
	}
};

}

template<typename a>
class Io : public Detail::IoBase<a> {
public:
	Io(typename Detail::IoBase<a>::CoreFunc core_) : Detail::IoBase<a>(std::move(core_)) { }

	/* (>>=) :: IO a -> (a -> IO b) -> IO b*/
	template<typename f>
	Io<Detail::IoResult<f, a>>
	then(f func) const {
		using b = Detail::IoResult<f, a>;
		auto core_copy = this->core;
		/* Continuation Monad.  */
		return Io<b>([ core_copy
			     , func
			     ]( typename Detail::PassFunc<b>::type pass
			      , Detail::FailFunc fail
			      ) {
			auto sub_pass = [func, pass, fail](a value) {
				auto next = std::unique_ptr<Io<b>>();
				try {
					next.reset(new Io<b>(func(std::move(value))));
				} catch (...) {
					return fail(std::current_exception());
				}
				Detail::IoBase<b>::invoke(next->core, pass, fail);
			};
			Detail::IoBase<a>::invoke(core_copy, sub_pass, fail);
		});
	}

	/* Executes the action.  Exactly one of pass or fail
	 * is called, at most once.
	 */
	void run( std::function<void(a)> pass
		, Detail::FailFunc fail
		) const noexcept {
		auto completed = std::make_shared<bool>(false);
		auto sub_pass = [completed, pass](a value) {
			if (!*completed) {
				*completed = true;
				pass(std::move(value));
			}
		};
		auto sub_fail = [completed, fail](std::exception_ptr e) {
			if (!*completed) {
				*completed = true;
				fail(std::move(e));
			}
		};
		Detail::IoBase<a>::invoke(this->core, sub_pass, sub_fail);
	}
};

/* Separate then-implementation for Io<void>.  */
template<>
class Io<void> : public Detail::IoBase<void> {
public:
	Io(typename Detail::IoBase<void>::CoreFunc core_) : Detail::IoBase<void>(std::move(core_)) { }

	/* (>>=) :: IO () -> (() -> IO b) -> IO b*/
	template<typename f>
	Io<Detail::IoResult<f>>
	then(f func) const {
		using b = Detail::IoResult<f>;
		auto core_copy = core;
		return Io<b>([ core_copy
			     , func
			     ]( typename Detail::PassFunc<b>::type pass
			      , Detail::FailFunc fail
			      ) {
			auto sub_pass = [func, pass, fail]() {
				auto next = std::unique_ptr<Io<b>>();
				try {
					next.reset(new Io<b>(func()));
				} catch (...) {
					return fail(std::current_exception());
				}
				Detail::IoBase<b>::invoke(next->core, pass, fail);
			};
			Detail::IoBase<void>::invoke(core_copy, sub_pass, fail);
		});
	}

	void run( std::function<void()> pass
		, Detail::FailFunc fail
		) const noexcept {
		auto completed = std::make_shared<bool>(false);
		auto sub_pass = [completed, pass]() {
			if (!*completed) {
				*completed = true;
				pass();
			}
		};
		auto sub_fail = [completed, fail](std::exception_ptr e) {
			if (!*completed) {
				*completed = true;
				fail(std::move(e));
			}
		};
		invoke(core, sub_pass, sub_fail);
	}
};

template<typename a>
Io<a> lift(a val) {
	auto container = std::make_shared<a>(std::move(val));
	return Io<a>([container]( std::function<void(a)> pass
				, Detail::FailFunc
				) {
		pass(std::move(*container));
	});
}
inline
Io<void> lift() {
	return Io<void>([]( std::function<void()> pass
			  , Detail::FailFunc
			  ) {
		pass();
	});
}

}

#endif /* !defined(EV_IO_HPP) */
