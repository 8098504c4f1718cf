#include"Jsmn/Object.hpp"
#include"Ln/CommandId.hpp"

namespace Ln {

CommandId CommandId::from_json(Jsmn::Object const& js) {
	if (!js.is_number() && !js.is_string())
		throw Jsmn::TypeError();
	return CommandId(js.direct_text());
}

}
