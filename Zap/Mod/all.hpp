#ifndef ZAP_MOD_ALL_HPP
#define ZAP_MOD_ALL_HPP

#include<functional>
#include<memory>
#include<ostream>
#include<string>

namespace Ev { class ThreadPool; }
namespace Net { class Fd; }
namespace S { class Bus; }

namespace Zap { namespace Mod {

/** Zap::Mod::all
 *
 * @brief Constructs all the modules of the plugin.
 * Returns a shared pointer to an object that
 * cleans up all modules on destruction.
 */
std::shared_ptr<void> all( std::ostream& cout
			 , S::Bus& bus
			 , Ev::ThreadPool& threadpool
			 , std::function< Net::Fd( std::string const&
						 , std::string const&
						 )
					> open_rpc_socket
			 );

}}

#endif /* !defined(ZAP_MOD_ALL_HPP) */
