#ifndef ZAP_MSG_MANIFESTCOMMAND_HPP
#define ZAP_MSG_MANIFESTCOMMAND_HPP

#include<string>

namespace Zap { namespace Msg {

/** struct Zap::Msg::ManifestCommand
 *
 * @brief emitted while handling a Zap::Msg::Manifestation
 * in order to register a command.
 */
struct ManifestCommand {
	std::string name;
	std::string usage;
	std::string description;
	bool deprecated;
};

}}

#endif /* !defined(ZAP_MSG_MANIFESTCOMMAND_HPP) */
