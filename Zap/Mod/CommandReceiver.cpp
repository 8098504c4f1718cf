#include"Ev/Io.hpp"
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include"Ln/CommandId.hpp"
#include"S/Bus.hpp"
#include"Zap/Mod/CommandReceiver.hpp"
#include"Zap/Msg/CommandFail.hpp"
#include"Zap/Msg/CommandRequest.hpp"
#include"Zap/Msg/CommandResponse.hpp"
#include"Zap/Msg/JsonCin.hpp"
#include"Zap/Msg/JsonCout.hpp"
#include"Zap/Msg/Notification.hpp"
#include"Zap/concurrent.hpp"

namespace Zap { namespace Mod {

bool CommandReceiver::take_pending(std::string const& id) {
	auto it = pendings.find(id);
	if (it == pendings.end())
		return false;
	pendings.erase(it);
	return true;
}

CommandReceiver::CommandReceiver(S::Bus& bus_) : bus(bus_) {
	bus.subscribe<Zap::Msg::JsonCin>([this](Zap::Msg::JsonCin const& cin_msg) {
		auto& inp = cin_msg.obj;

		/* Silently ignore anything that is not a request.  */
		if (!inp.is_object())
			return Ev::lift();
		if (!inp.has("method"))
			return Ev::lift();
		if (!inp["method"].is_string())
			return Ev::lift();

		auto method = std::string(inp["method"]);
		auto params = inp.has("params")
			    ? inp["params"]
			    : Jsmn::Object()
			    ;

		if (!inp.has("id"))
			return Zap::concurrent(
				bus.raise(Zap::Msg::Notification{
					method, params
				})
			);

		auto id = Ln::CommandId();
		try {
			id = Ln::CommandId::from_json(inp["id"]);
		} catch (Jsmn::TypeError const&) {
			return Ev::lift();
		}
		pendings.insert(id.json());

		return Zap::concurrent(
			bus.raise(Zap::Msg::CommandRequest{
				method, params, id
			})
		);
	});
	bus.subscribe<Zap::Msg::CommandResponse>([this](Zap::Msg::CommandResponse const& resp) {
		if (!take_pending(resp.id.json()))
			return Ev::lift();
		auto js = Json::Out()
			.start_object()
				.field("jsonrpc", std::string("2.0"))
				.field("id", Json::Out::direct(resp.id.json()))
				.field("result", resp.response)
			.end_object()
			;
		return bus.raise(Zap::Msg::JsonCout{std::move(js)});
	});
	bus.subscribe<Zap::Msg::CommandFail>([this](Zap::Msg::CommandFail const& fail) {
		if (!take_pending(fail.id.json()))
			return Ev::lift();
		auto js = Json::Out()
			.start_object()
				.field("jsonrpc", std::string("2.0"))
				.field("id", Json::Out::direct(fail.id.json()))
				.start_object("error")
					.field("code", fail.code)
					.field("message", fail.message)
					.field("data", fail.data)
				.end_object()
			.end_object()
			;
		return bus.raise(Zap::Msg::JsonCout{std::move(js)});
	});
}

}}
