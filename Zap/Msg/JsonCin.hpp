#ifndef ZAP_MSG_JSONCIN_HPP
#define ZAP_MSG_JSONCIN_HPP

#include"Jsmn/Object.hpp"

namespace Zap { namespace Msg {

/** struct Zap::Msg::JsonCin
 *
 * @brief emitted for each JSON object read from
 * stdin.
 */
struct JsonCin {
	Jsmn::Object obj;
};

}}

#endif /* !defined(ZAP_MSG_JSONCIN_HPP) */
