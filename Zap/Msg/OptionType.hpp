#ifndef ZAP_MSG_OPTIONTYPE_HPP
#define ZAP_MSG_OPTIONTYPE_HPP

namespace Zap { namespace Msg {

/** enum Zap::Msg::OptionType
 *
 * @brief the types that a `lightningd` option can have.
 */
enum OptionType {
	OptionType_String,
	OptionType_Bool,
	OptionType_Int,
	OptionType_Flag
};

}}

#endif /* !defined(ZAP_MSG_OPTIONTYPE_HPP) */
