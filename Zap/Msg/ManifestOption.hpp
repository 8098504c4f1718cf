#ifndef ZAP_MSG_MANIFESTOPTION_HPP
#define ZAP_MSG_MANIFESTOPTION_HPP

#include"Zap/Msg/OptionType.hpp"
#include"Json/Out.hpp"
#include<string>

namespace Zap { namespace Msg {

/** struct Zap::Msg::ManifestOption
 *
 * @brief emit in response to `Zap::Msg::Manifestation` to
 * register an option.
 *
 * @desc A `multi` option may be given several times;
 * lightningd then passes an array of values.
 */
struct ManifestOption {
	std::string name;
	OptionType type;
	/* Empty for an option with no default.  */
	Json::Out default_value;
	std::string description;
	bool multi;
};

}}

#endif /* !defined(ZAP_MSG_MANIFESTOPTION_HPP) */
