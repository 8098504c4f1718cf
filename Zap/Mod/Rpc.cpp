#include"Ev/Io.hpp"
#include"Jsmn/ParseError.hpp"
#include"Jsmn/Parser.hpp"
#include"Json/Out.hpp"
#include"Net/Fd.hpp"
#include"S/Bus.hpp"
#include"Util/make_unique.hpp"
#include"Zap/Mod/Rpc.hpp"
#include"Zap/Shutdown.hpp"
#include"Zap/log.hpp"
#include<algorithm>
#include<cstdint>
#include<errno.h>
#include<ev.h>
#include<fcntl.h>
#include<iterator>
#include<map>
#include<poll.h>
#include<sstream>
#include<string.h>
#include<unistd.h>

namespace {

/* Keeps debug logs readable.  */
std::string abbreviate(Jsmn::Object const& val) {
	auto text = val.direct_text();
	if (text.size() > 160)
		return text.substr(0, 160) + "...";
	return text;
}

/* Is the fd ready right now?  */
bool is_ready(int fd, short events) {
	auto pollarg = pollfd();
	pollarg.fd = fd;
	pollarg.events = events;
	pollarg.revents = 0;

	auto res = int();
	do {
		res = poll(&pollarg, 1, 0);
	} while (res < 0 && errno == EINTR);
	if (res < 0)
		/* Let the read or write report the error.  */
		return true;
	return (pollarg.revents & (events | POLLHUP | POLLERR)) != 0;
}

}

namespace Zap { namespace Mod {

std::string RpcError::make_error_message( std::string const& command
					, Jsmn::Object const& e
					) {
	auto os = std::ostringstream();
	os << command << ": " << e;
	return os.str();
}

RpcError::RpcError( std::string command_
		  , Jsmn::Object error_
		  ) : std::runtime_error(make_error_message(command_, error_))
		    , command(command_)
		    , error(error_)
		    { }

class Rpc::Impl {
private:
	S::Bus& bus;

	Net::Fd socket;
	Jsmn::Parser parser;

	/* Set once no further command can succeed.  */
	std::exception_ptr broken;

	std::uint64_t next_id;

	struct Pending {
		std::string command;
		std::function<void(Jsmn::Object)> pass;
		std::function<void(std::exception_ptr)> fail;
	};
	std::map<std::uint64_t, Pending> pendings;

	std::vector<char> to_write;
	std::string read_buffer;

	ev_io read_event;
	ev_io write_event;
	bool write_active;

	void stop_events() {
		ev_io_stop(EV_DEFAULT_ &read_event);
		if (write_active) {
			ev_io_stop(EV_DEFAULT_ &write_event);
			write_active = false;
		}
	}

	/* Fails everything outstanding with `e`.  */
	void breakdown(std::exception_ptr e) {
		if (broken)
			return;
		broken = e;
		stop_events();
		to_write.clear();

		auto pendings_copy = std::move(pendings);
		pendings.clear();
		for (auto const& ip : pendings_copy)
			ip.second.fail(e);
	}
	template<typename E>
	void breakdown(E e) {
		try {
			throw e;
		} catch (...) {
			breakdown(std::current_exception());
		}
	}

	void process_response(Jsmn::Object const& resp) {
		/* Ignore anything that is not ours.  */
		if (!resp.is_object())
			return;
		if (!resp.has("id"))
			return;
		if (!resp["id"].is_number())
			return;

		auto id = std::uint64_t(double(resp["id"]));
		auto it = pendings.find(id);
		if (it == pendings.end())
			return;

		auto p = std::move(it->second);
		pendings.erase(it);
		if (resp.has("error")) {
			try {
				throw RpcError( std::move(p.command)
					      , resp["error"]
					      );
			} catch (...) {
				p.fail(std::current_exception());
			}
		} else if (resp.has("result")) {
			p.pass(resp["result"]);
		} else {
			try {
				throw RpcError(std::move(p.command), resp);
			} catch (...) {
				p.fail(std::current_exception());
			}
		}
	}

	void on_read() {
		auto static constexpr chunk_size = std::size_t(4096);
		char buf[chunk_size];

		while (!broken && is_ready(socket.get(), POLLIN)) {
			auto res = ssize_t();
			do {
				res = read(socket.get(), buf, chunk_size);
			} while (res < 0 && errno == EINTR);
			if (res < 0 && (errno == EWOULDBLOCK || errno == EAGAIN))
				break;
			if (res < 0)
				return breakdown(std::runtime_error(
					std::string("Rpc: read: ") +
					strerror(errno)
				));
			if (res == 0)
				return breakdown(std::runtime_error(
					"Rpc: read: lightningd closed the "
					"RPC socket."
				));
			read_buffer.append(buf, std::size_t(res));
		}
		if (broken || read_buffer.empty())
			return;

		auto responses = std::vector<Jsmn::Object>();
		try {
			responses = parser.feed(read_buffer);
		} catch (Jsmn::ParseError const& e) {
			return breakdown(e);
		}
		read_buffer.clear();
		for (auto const& r : responses)
			process_response(r);
	}
	static
	void on_read_static(EV_P_ ev_io *e, int) {
		auto self = reinterpret_cast<Impl*>(e->data);
		self->on_read();
	}

	void on_write() {
		while ( !broken
		     && !to_write.empty()
		     && is_ready(socket.get(), POLLOUT)
		      ) {
			auto res = ssize_t();
			do {
				res = write( socket.get()
					   , &to_write[0], to_write.size()
					   );
			} while (res < 0 && errno == EINTR);
			if (res < 0 && (errno == EWOULDBLOCK || errno == EAGAIN))
				break;
			if (res < 0)
				return breakdown(std::runtime_error(
					std::string("Rpc: write: ") +
					strerror(errno)
				));
			to_write.erase( to_write.begin()
				      , to_write.begin() + res
				      );
		}
		if (broken)
			return;
		if (to_write.empty() && write_active) {
			ev_io_stop(EV_DEFAULT_ &write_event);
			write_active = false;
		} else if (!to_write.empty() && !write_active) {
			ev_io_start(EV_DEFAULT_ &write_event);
			write_active = true;
		}
	}
	static
	void on_write_static(EV_P_ ev_io *e, int) {
		auto self = reinterpret_cast<Impl*>(e->data);
		self->on_write();
	}

	Ev::Io<Jsmn::Object> core_command( std::string const& command
					 , Json::Out params
					 ) {
		return Ev::Io<Jsmn::Object>([this, command, params]( std::function<void(Jsmn::Object)> pass
					       , std::function<void(std::exception_ptr)> fail
					       ) {
			if (broken)
				return fail(broken);

			auto id = next_id++;
			auto js = Json::Out()
				.start_object()
					.field("jsonrpc", std::string("2.0"))
					.field("id", id)
					.field("method", command)
					.field("params", params)
				.end_object()
				.output() + "\n\n";
			std::copy( js.begin(), js.end()
				 , std::back_inserter(to_write)
				 );

			pendings[id] = Pending{ command
					      , std::move(pass)
					      , std::move(fail)
					      };
			on_write();
		});
	}

public:
	Impl( S::Bus& bus_
	    , Net::Fd socket_
	    ) : bus(bus_)
	      , socket(std::move(socket_))
	      , next_id(0)
	      , write_active(false)
	      {
		auto flags = fcntl(socket.get(), F_GETFL);
		if (flags < 0 || fcntl(socket.get(), F_SETFL, flags | O_NONBLOCK) < 0)
			throw std::runtime_error(
				std::string("Rpc: fcntl: ") + strerror(errno)
			);

		ev_io_init( &read_event, &on_read_static
			  , socket.get(), EV_READ
			  );
		read_event.data = this;
		ev_io_start(EV_DEFAULT_ &read_event);

		ev_io_init( &write_event, &on_write_static
			  , socket.get(), EV_WRITE
			  );
		write_event.data = this;

		bus.subscribe<Zap::Shutdown>([this](Zap::Shutdown const&) {
			breakdown(Zap::Shutdown());
			return Ev::lift();
		});
	}

	~Impl() {
		breakdown(Zap::Shutdown());
	}

	Ev::Io<Jsmn::Object> command( std::string const& command
				    , Json::Out params
				    ) {
		auto pout = params.output();
		return Zap::log( bus, Debug
			       , "Rpc out: %s %s"
			       , command.c_str()
			       , pout.c_str()
			       ).then([this, command, params]() {
			return core_command(command, params);
		}).then([this, command](Jsmn::Object result) {
			return Zap::log( bus, Debug
				       , "Rpc in: %s => %s"
				       , command.c_str()
				       , abbreviate(result).c_str()
				       ).then([result]() {
				return Ev::lift(result);
			});
		}).catching<RpcError>([this](RpcError const& e) {
			auto copy = e;
			return Zap::log( bus, Debug
				       , "Rpc in: %s => error %s"
				       , e.command.c_str()
				       , abbreviate(e.error).c_str()
				       ).then([copy]() {
				throw copy;
				return Ev::lift(copy.error);
			});
		});
	}
};

Rpc::Rpc( S::Bus& bus
	, Net::Fd socket
	) : pimpl(Util::make_unique<Impl>(bus, std::move(socket)))
	  { }
Rpc::Rpc(Rpc&& o) : pimpl(std::move(o.pimpl)) { }
Rpc::~Rpc() { }

Ev::Io<Jsmn::Object> Rpc::command( std::string const& command
				 , Json::Out params
				 ) {
	return pimpl->command(command, std::move(params));
}

}}
