#ifndef ZAP_MOD_JSONOUTPUTTER_HPP
#define ZAP_MOD_JSONOUTPUTTER_HPP

#include<ostream>
#include<queue>
#include<string>

namespace Ev { template<typename a> class Io; }
namespace S { class Bus; }

namespace Zap { namespace Mod {

/** class Zap::Mod::JsonOutputter
 *
 * @brief writes each Zap::Msg::JsonCout as one line on
 * stdout, in the order they were raised.
 */
class JsonOutputter {
private:
	std::ostream& cout;
	std::queue<std::string> outs;

	Ev::Io<void> drain();
public:
	JsonOutputter( std::ostream& cout_
		     , S::Bus& bus_
		     );
};

}}

#endif /* !defined(ZAP_MOD_JSONOUTPUTTER_HPP) */
