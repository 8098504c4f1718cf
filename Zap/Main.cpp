#include"Ev/Io.hpp"
#include"Ev/ThreadPool.hpp"
#include"Ev/yield.hpp"
#include"Net/Fd.hpp"
#include"S/Bus.hpp"
#include"Util/make_unique.hpp"
#include"Zap/JsonInput.hpp"
#include"Zap/Main.hpp"
#include"Zap/Mod/all.hpp"
#include"Zap/Msg/Begin.hpp"
#include"Zap/Msg/Exit.hpp"
#include"Zap/Shutdown.hpp"
#include"Zap/concurrent.hpp"
#include<iostream>
#include<string>

#ifdef HAVE_CONFIG_H
# include "config.h"
#endif

namespace Zap {

class Main::Impl {
private:
	std::istream& cin;
	std::ostream& cout;
	std::ostream& cerr;
	std::function< Net::Fd( std::string const&
			      , std::string const&
			      )
		     > open_rpc_socket;
	std::function<void(int)> exit_process;

	std::unique_ptr<S::Bus> bus;
	std::unique_ptr<Ev::ThreadPool> threadpool;
	std::unique_ptr<Zap::JsonInput> jsoninput;
	std::shared_ptr<void> modules;

	int exit_code;
	bool exiting;

	std::string argv0;
	bool is_version;
	bool is_help;

	Ev::Io<void> exit(Zap::Msg::Exit const& e) {
		if (exiting)
			return Ev::lift();
		exiting = true;
		auto code = e.code;
		return bus->raise(Zap::Shutdown()).then([]() {
			/* Let the outputter flush pending log lines.  */
			return Ev::yield();
		}).then([]() {
			return Ev::yield();
		}).then([this, code]() {
			cout.flush();
			exit_process(code);
			return Ev::lift();
		});
	}

public:
	Impl( std::vector<std::string> argv
	    , std::istream& cin_
	    , std::ostream& cout_
	    , std::ostream& cerr_
	    , std::function< Net::Fd( std::string const&
				    , std::string const&
				    )
			   > open_rpc_socket_
	    , std::function<void(int)> exit_process_
	    ) : cin(cin_)
	      , cout(cout_)
	      , cerr(cerr_)
	      , open_rpc_socket(std::move(open_rpc_socket_))
	      , exit_process(std::move(exit_process_))
	      , exit_code(0)
	      , exiting(false)
	      , argv0(argv.empty() ? std::string("clzap") : argv[0])
	      , is_version(false)
	      , is_help(false)
	      {
		if (argv.size() >= 2) {
			auto argv1 = argv[1];
			if (argv1 == "--version" || argv1 == "-V")
				is_version = true;
			else if (argv1 == "--help" || argv1 == "-H")
				is_help = true;
			else {
				cerr << argv0 << ":"
				     << " Unrecognized option: " << argv1
				     << std::endl;
				is_help = true;
			}
		}
	}

	Ev::Io<int> run() {
		if (is_version) {
			cout << PACKAGE_STRING << std::endl;
			return Ev::lift(0);
		} else if (is_help) {
			cout << "Usage: add --plugin=" << argv0 << " to your lightningd command line or configuration file" << std::endl
			     << std::endl
			     << "Publishes NIP-57 zap receipts for zap invoices paid to this node." << std::endl
			     << std::endl
			     << "Options:" << std::endl
			     << " --version, -V      Show version." << std::endl
			     << " --help, -H         Show this help." << std::endl
			     << std::endl
			     << "Send bug reports to: " << PACKAGE_BUGREPORT << std::endl
			     ;
			return Ev::lift(0);
		}

		bus = Util::make_unique<S::Bus>();
		threadpool = Util::make_unique<Ev::ThreadPool>();
		jsoninput = Util::make_unique<Zap::JsonInput>(
			*threadpool, cin, *bus
		);
		modules = Zap::Mod::all( cout
				       , *bus
				       , *threadpool
				       , open_rpc_socket
				       );
		bus->subscribe<Zap::Msg::Exit>([this](Zap::Msg::Exit const& e) {
			return Zap::concurrent(exit(e));
		});

		return Ev::yield().then([this]() {
			return bus->raise(Zap::Msg::Begin());
		}).then([this]() {
			/* Main loop; ends when lightningd closes stdin.  */
			return jsoninput->run().catching<std::exception>([this](std::exception const& e) {
				cerr << "Uncaught exception: " << e.what() << std::endl;
				exit_code = 1;
				return Ev::lift();
			});
		}).then([this]() {
			exiting = true;
			return bus->raise(Zap::Shutdown());
		}).then([this]() {
			return Ev::lift(exit_code);
		});
	}
};

Main::Main( std::vector<std::string> argv
	  , std::istream& cin
	  , std::ostream& cout
	  , std::ostream& cerr
	  , std::function< Net::Fd( std::string const&
				  , std::string const&
				  )
			 > open_rpc_socket
	  , std::function<void(int)> exit_process
	  ) : pimpl(Util::make_unique<Impl>( std::move(argv)
					   , cin
					   , cout
					   , cerr
					   , std::move(open_rpc_socket)
					   , std::move(exit_process)
					   ))
	    { }
Main::Main(Main&& o) : pimpl(std::move(o.pimpl)) { }
Main::~Main() { }

Ev::Io<int> Main::run() {
	return pimpl->run();
}

}
