#ifndef ZAP_JSONINPUT_HPP
#define ZAP_JSONINPUT_HPP

#include<istream>
#include<memory>

namespace Ev { template<typename a> class Io; }
namespace Ev { class ThreadPool; }
namespace S { class Bus; }

namespace Zap {

/** class Zap::JsonInput
 *
 * @brief reads JSON objects from lightningd on stdin
 * and emits a Zap::Msg::JsonCin for each.
 *
 * @desc The action returned by `run` completes when
 * stdin reaches end-of-file, which is lightningd
 * telling the plugin to stop.
 */
class JsonInput {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	explicit
	JsonInput( Ev::ThreadPool& threadpool
		 , std::istream& cin
		 , S::Bus& bus
		 );
	JsonInput(JsonInput&&);
	~JsonInput();

	Ev::Io<void> run();
};

}

#endif /* !defined(ZAP_JSONINPUT_HPP) */
