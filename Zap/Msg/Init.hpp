#ifndef ZAP_MSG_INIT_HPP
#define ZAP_MSG_INIT_HPP

#include"Sqlite3/Db.hpp"
#include<string>

namespace Zap { namespace Mod { class Rpc; }}

namespace Zap { namespace Msg {

/** struct Zap::Msg::Init
 *
 * @brief emitted when the `init` command is
 * performed, after every Zap::Msg::Option.
 *
 * @desc The working directory is the lightning
 * network directory by then, so relative paths
 * resolve there.
 */
struct Init {
	Zap::Mod::Rpc& rpc;
	Sqlite3::Db db;
	std::string network;
};

}}

#endif /* !defined(ZAP_MSG_INIT_HPP) */
