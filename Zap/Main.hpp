#ifndef ZAP_MAIN_HPP
#define ZAP_MAIN_HPP

#include<functional>
#include<istream>
#include<memory>
#include<ostream>
#include<string>
#include<vector>

namespace Ev { template<typename a> class Io; }
namespace Net { class Fd; }

namespace Zap {

/** class Zap::Main
 *
 * @brief the whole plugin: builds the modules and
 * runs them on the given streams.
 *
 * @desc `run` completes with the exit code when stdin
 * closes.  A Zap::Msg::Exit ends the plugin earlier by
 * calling `exit_process` with its code after the
 * modules have seen a Zap::Shutdown.
 */
class Main {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Main() = delete;
	Main( std::vector<std::string> argv
	    , std::istream& cin
	    , std::ostream& cout
	    , std::ostream& cerr
	    , std::function< Net::Fd( std::string const&
				    , std::string const&
				    )
			   > open_rpc_socket
	    , std::function<void(int)> exit_process
	    );
	Main(Main&&);
	~Main();

	Ev::Io<int> run();
};

}

#endif /* !defined(ZAP_MAIN_HPP) */
