#include"Ev/Io.hpp"
#include"Ev/ThreadPool.hpp"
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include"Net/Fd.hpp"
#include"S/Bus.hpp"
#include"Sqlite3/Db.hpp"
#include"Sqlite3/Tx.hpp"
#include"Util/BacktraceException.hpp"
#include"Util/make_unique.hpp"
#include"Zap/Mod/Initiator.hpp"
#include"Zap/Mod/Rpc.hpp"
#include"Zap/Msg/CommandRequest.hpp"
#include"Zap/Msg/CommandResponse.hpp"
#include"Zap/Msg/Exit.hpp"
#include"Zap/Msg/Init.hpp"
#include"Zap/Msg/ManifestOption.hpp"
#include"Zap/Msg/Option.hpp"
#include"Zap/log.hpp"
#include<set>
#include<sstream>
#include<stdexcept>

#ifdef HAVE_CONFIG_H
# include "config.h"
#endif

namespace {

/* `init` parameters we cannot work with.  */
class InitError : public Util::BacktraceException<std::runtime_error> {
public:
	InitError(std::string const& comment, Jsmn::Object const& js)
		: Util::BacktraceException<std::runtime_error>(
			make_message(comment, js)
		  ) { }
private:
	static std::string make_message( std::string const& comment
				       , Jsmn::Object const& js
				       ) {
		auto os = std::ostringstream();
		os << comment << ": " << js;
		return os.str();
	}
};

/* Field `name` of `obj` if it is a string, else `dflt`.  */
std::string string_field( Jsmn::Object const& obj
			, char const* name
			, std::string dflt
			) {
	if (!obj.has(name))
		return dflt;
	auto js = obj[name];
	if (!js.is_string())
		throw InitError(std::string(name) + " not string", js);
	return std::string(js);
}

}

namespace Zap { namespace Mod {

class Initiator::Impl {
private:
	S::Bus& bus;
	Ev::ThreadPool& threadpool;
	std::function<Net::Fd( std::string const&
			     , std::string const&
			     )> open_rpc_socket;

	bool initted;
	Ln::CommandId init_id;
	std::unique_ptr<Zap::Mod::Rpc> rpc;
	Sqlite3::Db db;

	/* Names registered through Zap::Msg::ManifestOption.  */
	std::set<std::string> options;

	Ev::Io<void> handle_options(Jsmn::Object const& params) {
		if (!params.has("options"))
			return Ev::lift();
		auto options_j = params["options"];
		if (!options_j.is_object())
			throw InitError("options not object", options_j);

		auto act = Ev::lift();
		for (auto const& o : options) {
			if (!options_j.has(o))
				continue;
			auto msg = Zap::Msg::Option{o, options_j[o]};
			act = act.then([this, msg]() {
				return bus.raise(msg);
			});
		}
		return act;
	}

	Ev::Io<void> init(Jsmn::Object params) {
		if (!params.is_object())
			throw InitError("params not object", params);
		if (!params.has("configuration"))
			throw InitError("no 'configuration' param", params);
		auto configuration = params["configuration"];
		if (!configuration.is_object())
			throw InitError("configuration not object", configuration);

		auto network = string_field(configuration, "network", "bitcoin");
		auto lightning_dir = string_field( configuration
						 , "lightning-dir", "."
						 );
		auto rpc_file = string_field( configuration
					    , "rpc-file", "lightning-rpc"
					    );

		return Zap::log( bus, Info, "%s", PACKAGE_STRING
			       ).then([this, params]() {
			return handle_options(params);
		}).then([this, lightning_dir, rpc_file]() {
			return threadpool.background<Net::Fd>([ this
							      , lightning_dir
							      , rpc_file
							      ]() {
				return open_rpc_socket(lightning_dir, rpc_file);
			});
		}).then([this](Net::Fd fd) {
			rpc = Util::make_unique<Zap::Mod::Rpc>(bus, std::move(fd));
			return Zap::log(bus, Debug, "Initiator: RPC socket opened.");
		}).then([this]() {
			db = Sqlite3::Db("data.clzap");
			return db.transact();
		}).then([this](Sqlite3::Tx tx) {
			/* "CLZA" */
			tx.query_execute("PRAGMA application_id = 0x434C5A41;");
			tx.commit();
			return Zap::log(bus, Debug, "Initiator: database opened.");
		}).then([this, network]() {
			return bus.raise(Zap::Msg::Init{*rpc, db, network});
		}).then([this]() {
			return bus.raise(Zap::Msg::CommandResponse{
				init_id, Json::Out::empty_object()
			});
		}).then([this]() {
			return Zap::log(bus, Info, "Started.");
		});
	}

public:
	Impl( S::Bus& bus_
	    , Ev::ThreadPool& threadpool_
	    , std::function<Net::Fd( std::string const&
				   , std::string const&
				   )> open_rpc_socket_
	    ) : bus(bus_)
	      , threadpool(threadpool_)
	      , open_rpc_socket(std::move(open_rpc_socket_))
	      , initted(false)
	      {
		bus.subscribe<Zap::Msg::CommandRequest>([this](Zap::Msg::CommandRequest const& c) {
			if (c.command != "init")
				return Ev::lift();
			if (initted)
				return Zap::log( bus, Warn
					       , "Initiator: ignoring repeated init."
					       );
			initted = true;
			init_id = c.id;

			auto params = c.params;
			return Ev::lift().then([this, params]() {
				return init(params);
			}).catching<std::exception>([this](std::exception const& e) {
				auto reason = std::string(e.what());
				return Zap::log( bus, Error
					       , "init: %s"
					       , reason.c_str()
					       ).then([this, reason]() {
					return bus.raise(Zap::Msg::Exit{1, reason});
				});
			});
		});

		bus.subscribe<Zap::Msg::ManifestOption>([this](Zap::Msg::ManifestOption const& o) {
			options.insert(o.name);
			return Ev::lift();
		});
	}
};

Initiator::Initiator( S::Bus& bus
		    , Ev::ThreadPool& threadpool
		    , std::function<Net::Fd( std::string const&
					   , std::string const&
					   )> open_rpc_socket
		    ) : pimpl(Util::make_unique<Impl>( bus, threadpool
						     , std::move(open_rpc_socket)
						     ))
		      { }
Initiator::Initiator(Initiator&& o) : pimpl(std::move(o.pimpl)) { }
Initiator::~Initiator() { }

}}
