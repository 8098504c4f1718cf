#ifndef ZAP_MOD_RPC_HPP
#define ZAP_MOD_RPC_HPP

#include"Jsmn/Object.hpp"
#include<memory>
#include<stdexcept>
#include<string>

namespace Ev { template<typename a> class Io; }
namespace Json { class Out; }
namespace Net { class Fd; }
namespace S { class Bus; }

namespace Zap { namespace Mod {

/* lightningd answered a command with an `error`.  */
struct RpcError : public std::runtime_error {
private:
	static
	std::string make_error_message( std::string const&
				      , Jsmn::Object const&
				      );
public:
	RpcError() =delete;
	explicit
	RpcError(std::string command, Jsmn::Object error);

	std::string command;
	Jsmn::Object error;
};

/** class Zap::Mod::Rpc
 *
 * @brief JSON-RPC client on the lightningd RPC
 * socket.
 *
 * @desc Constructed by Zap::Mod::Initiator once `init`
 * tells us where the socket is.  Several commands may
 * be outstanding at once; each resolves when its
 * response arrives.  After a Zap::Shutdown, or once
 * the socket fails, every pending and future command
 * fails.
 */
class Rpc {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	explicit
	Rpc(S::Bus& bus, Net::Fd socket);
	Rpc(Rpc&&);
	~Rpc();

	Ev::Io<Jsmn::Object> command( std::string const& command
				    , Json::Out params
				    );
};

}}

#endif /* !defined(ZAP_MOD_RPC_HPP) */
