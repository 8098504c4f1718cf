#ifndef ZAP_MOD_INITIATOR_HPP
#define ZAP_MOD_INITIATOR_HPP

#include<functional>
#include<memory>
#include<string>

namespace Ev { class ThreadPool; }
namespace Net { class Fd; }
namespace S { class Bus; }

namespace Zap { namespace Mod {

/** class Zap::Mod::Initiator
 *
 * @brief handles the `init` command: hands option
 * values out as Zap::Msg::Option, opens the RPC socket
 * and the database, then broadcasts Zap::Msg::Init.
 *
 * @desc If anything fails, including a module
 * rejecting its configuration while handling
 * Zap::Msg::Init, the failure is logged and the
 * plugin exits with a nonzero status.
 */
class Initiator {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Initiator() =delete;

	Initiator( S::Bus& bus
		 , Ev::ThreadPool& threadpool
		 , std::function<Net::Fd( std::string const&
					, std::string const&
					)> open_rpc_socket
		 );
	Initiator(Initiator&&);
	~Initiator();
};

}}

#endif /* !defined(ZAP_MOD_INITIATOR_HPP) */
