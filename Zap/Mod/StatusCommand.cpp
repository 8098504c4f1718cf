#include"Ev/Io.hpp"
#include"Ev/yield.hpp"
#include"S/Bus.hpp"
#include"Zap/Mod/StatusCommand.hpp"
#include"Zap/Msg/CommandRequest.hpp"
#include"Zap/Msg/CommandResponse.hpp"
#include"Zap/Msg/ManifestCommand.hpp"
#include"Zap/Msg/Manifestation.hpp"
#include"Zap/Msg/ProvideStatus.hpp"
#include"Zap/Msg/SolicitStatus.hpp"
#include"Zap/concurrent.hpp"

namespace Zap { namespace Mod {

void StatusCommand::start() {
	using std::placeholders::_1;
	typedef StatusCommand This;

	bus.subscribe<Zap::Msg::Manifestation>(
		std::bind(&This::on_manifest, this, _1)
	);
	bus.subscribe<Zap::Msg::CommandRequest>(
		std::bind(&This::on_command, this, _1)
	);
	bus.subscribe<Zap::Msg::ProvideStatus>(
		std::bind(&This::on_status, this, _1)
	);
}
Ev::Io<void> StatusCommand::on_manifest(Zap::Msg::Manifestation const&) {
	return bus.raise(Zap::Msg::ManifestCommand{
		"clzap-status", "",
		"Show the zap receipt cursor, any receipt being retried, "
		"and recently handled payments.",
		false
	});
}
Ev::Io<void> StatusCommand::on_command(Zap::Msg::CommandRequest const& c) {
	if (c.command != "clzap-status")
		return Ev::lift();

	/* Another request is being answered; retry later.  */
	if (soliciting)
		return Zap::concurrent(Ev::yield().then([this, c]() {
			return on_command(c);
		}));

	soliciting = true;
	id = c.id;
	return Ev::yield().then([this]() {
		return bus.raise(Zap::Msg::SolicitStatus{});
	}).then([this]() {
		soliciting = false;
		auto fields = std::move(this->fields);
		this->fields.clear();
		auto result = Json::Out();
		auto obj = result.start_object();
		for (auto const& f : fields)
			obj.field(f.first, f.second);
		obj.end_object();
		return bus.raise(Zap::Msg::CommandResponse{id, result});
	});
}
Ev::Io<void> StatusCommand::on_status(Zap::Msg::ProvideStatus const& s) {
	if (!soliciting)
		return Ev::lift();
	fields.erase(s.key);
	fields.emplace(s.key, s.value);
	return Ev::lift();
}

}}
