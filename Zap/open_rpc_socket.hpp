#ifndef ZAP_OPEN_RPC_SOCKET_HPP
#define ZAP_OPEN_RPC_SOCKET_HPP

#include<string>

namespace Net { class Fd; }

namespace Zap {

/** Zap::open_rpc_socket()
 *
 * @brief changes to the given directory, and
 * attempts to open the given socket.
 *
 * @desc A separate function so tests can replace it.
 */
Net::Fd open_rpc_socket( std::string const& lightning_dir = "."
		       , std::string const& rpc_file = "lightning-rpc"
		       );

}

#endif /* !defined(ZAP_OPEN_RPC_SOCKET_HPP) */
