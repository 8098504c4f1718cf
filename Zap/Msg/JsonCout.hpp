#ifndef ZAP_MSG_JSONCOUT_HPP
#define ZAP_MSG_JSONCOUT_HPP

#include"Json/Out.hpp"

namespace Zap { namespace Msg {

/** struct Zap::Msg::JsonCout
 *
 * @brief emit to write a JSON object to stdout,
 * i.e. to lightningd.
 */
struct JsonCout {
	Json::Out obj;
};

}}

#endif /* !defined(ZAP_MSG_JSONCOUT_HPP) */
