#include"Ev/Io.hpp"
#include"S/Bus.hpp"
#include"Zap/Mod/Manifester.hpp"
#include"Zap/Msg/CommandRequest.hpp"
#include"Zap/Msg/CommandResponse.hpp"
#include"Zap/Msg/ManifestNotification.hpp"
#include"Zap/Msg/Manifestation.hpp"

namespace {

char const* option_type_name(Zap::Msg::OptionType t) {
	switch (t) {
	case Zap::Msg::OptionType_String: return "string";
	case Zap::Msg::OptionType_Bool: return "bool";
	case Zap::Msg::OptionType_Int: return "int";
	case Zap::Msg::OptionType_Flag: return "flag";
	}
	return "string";
}

}

namespace Zap { namespace Mod {

void Manifester::start() {
	bus.subscribe<Zap::Msg::CommandRequest>([this](Zap::Msg::CommandRequest const& req) {
		if (req.command != "getmanifest")
			return Ev::lift();

		auto id = req.id;
		return Ev::lift().then([this]() {
			return bus.raise(Zap::Msg::Manifestation());
		}).then([this, id]() {
			/* Every module has registered by now.  */
			auto result = Json::Out();
			auto robj = result.start_object();
			robj
				.field("dynamic", false)
				.field("nonnumericids", true)
				;

			auto harr = robj.start_array("hooks");
			harr.end_array();

			auto narr = robj.start_array("subscriptions");
			for (auto const& n : notifications)
				narr.entry(n);
			narr.end_array();

			auto carr = robj.start_array("rpcmethods");
			for (auto const& c : commands) {
				auto const& info = c.second;
				carr.entry(
					Json::Out()
					.start_object()
						.field("name", info.name)
						.field("usage", info.usage)
						.field("description", info.description)
						.field("deprecated", info.deprecated)
					.end_object()
				);
			}
			carr.end_array();

			auto oarr = robj.start_array("options");
			for (auto const& n_o : options) {
				auto const& o = n_o.second;
				auto entry = Json::Out();
				auto eobj = entry.start_object();
				eobj
					.field("name", o.name)
					.field("type", std::string(option_type_name(o.type)))
					;
				/* Flags take no default; an empty one
				 * means none was given.  */
				if ( o.type != Zap::Msg::OptionType_Flag
				  && !o.default_value.output().empty()
				   )
					eobj.field("default", o.default_value);
				eobj
					.field("description", o.description)
					.field("multi", o.multi)
					;
				eobj.end_object();
				oarr.entry(entry);
			}
			oarr.end_array();

			robj.end_object();

			notifications.clear();
			commands.clear();
			options.clear();

			return bus.raise(Zap::Msg::CommandResponse{
				id, result
			});
		});
	});
	/* Registrations.  */
	bus.subscribe<Zap::Msg::ManifestCommand>([this](Zap::Msg::ManifestCommand const& c) {
		commands[c.name] = c;
		return Ev::lift();
	});
	bus.subscribe<Zap::Msg::ManifestNotification>([this](Zap::Msg::ManifestNotification const& n) {
		notifications.insert(n.name);
		return Ev::lift();
	});
	bus.subscribe<Zap::Msg::ManifestOption>([this](Zap::Msg::ManifestOption const& o) {
		options.erase(o.name);
		options.emplace(o.name, o);
		return Ev::lift();
	});
}

}}
