#ifndef ZAP_MSG_OPTION_HPP
#define ZAP_MSG_OPTION_HPP

#include"Jsmn/Object.hpp"
#include<string>

namespace Zap { namespace Msg {

/** struct Zap::Msg::Option
 *
 * @brief emitted during `init` handling, providing the value
 * of an option that we registered.
 */
struct Option {
	std::string name;
	Jsmn::Object value;
};

}}

#endif /* !defined(ZAP_MSG_OPTION_HPP) */
