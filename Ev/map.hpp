#ifndef EV_MAP_HPP
#define EV_MAP_HPP

#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Util/make_unique.hpp"
#include<cstddef>
#include<exception>
#include<memory>
#include<vector>

namespace Ev {

namespace Detail {

/* Shared state of one Ev::map call.  */
template<typename b>
struct MapJoin {
	std::vector<std::unique_ptr<b>> results;
	std::exception_ptr error;
	std::size_t pending;
	std::function<void(std::vector<b>)> pass;
	std::function<void(std::exception_ptr)> fail;

	void finish_one() {
		--pending;
		if (pending != 0)
			return;
		/* Move the continuations out first: they may hold
		 * the last reference to this object.  */
		auto my_pass = std::move(pass);
		auto my_fail = std::move(fail);
		if (error)
			return my_fail(error);
		auto rv = std::vector<b>();
		rv.reserve(results.size());
		for (auto& r : results)
			rv.emplace_back(std::move(*r));
		my_pass(std::move(rv));
	}
};

}

/** Ev::map
 *
 * @brief applies `func` to every item of `as`, each in
 * its own greenthread, and returns all results in input
 * order once every one has completed.
 *
 * @desc Items overlap only while they are suspended
 * (e.g. waiting on `Ev::ThreadPool` jobs); everything
 * still runs on one CPU.
 * If any item fails, the others still run to completion
 * and then one of the exceptions is rethrown, whatever
 * its type.
 */
/* mapIO :: (a -> IO b) -> [a] -> IO [b] */
template<typename f, typename a>
Io<std::vector<Detail::IoResult<f, a>>>
map(f func, std::vector<a> as) {
	using b = Detail::IoResult<f, a>;
	auto items = std::make_shared<std::vector<a>>(std::move(as));
	return Io<std::vector<b>>([ func
				  , items
				  ]( std::function<void(std::vector<b>)> pass
				   , std::function<void(std::exception_ptr)> fail
				   ) {
		if (items->empty())
			return pass(std::vector<b>());

		auto join = std::make_shared<Detail::MapJoin<b>>();
		join->results.resize(items->size());
		join->pending = items->size();
		join->pass = std::move(pass);
		join->fail = std::move(fail);

		for (auto i = std::size_t(0); i < items->size(); ++i) {
			auto item = std::make_shared<a>(std::move((*items)[i]));
			auto task = Ev::lift().then([func, item]() {
				return func(std::move(*item));
			}).then([join, i](b value) {
				join->results[i] = Util::make_unique<b>(std::move(value));
				return Ev::lift();
			});
			/* Any failure, of any type, still counts the
			 * item as finished.  */
			auto track = Io<void>([ task
					      , join
					      ]( std::function<void()> pass
					       , std::function<void(std::exception_ptr)>
					       ) {
				task.run([join, pass]() {
					pass();
					join->finish_one();
				}, [join, pass](std::exception_ptr e) {
					join->error = e;
					pass();
					join->finish_one();
				});
			});
			Ev::concurrent(track).run([]() { }, join->fail);
		}
	});
}

}

#endif /* !defined(EV_MAP_HPP) */
