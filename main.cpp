#include<Ev/Io.hpp>
#include<Ev/start.hpp>
#include<Net/Fd.hpp>
#include<Zap/Main.hpp>
#include<Zap/open_rpc_socket.hpp>
#include<curl/curl.h>
#include<iostream>
#include<memory>
#include<unistd.h>

namespace {

Ev::Io<int> io_main(int argc, char **argv) {
	auto arg_vec = std::vector<std::string>();
	for (int i = 0; i < argc; ++i) {
		arg_vec.push_back(std::string(argv[i]));
	}
	auto main_obj = std::make_shared<Zap::Main>(
		arg_vec, std::cin, std::cout, std::cerr,
		Zap::open_rpc_socket,
		[](int code) {
			std::cout.flush();
			std::cerr.flush();
			/* Relay threads may still be blocked in
			 * libcurl; do not wait for them.  */
			_exit(code);
		}
	);
	return main_obj->run().then([main_obj](int ec) {
		/* Ensures main_obj is alive!  */
		return Ev::lift(ec);
	});
}

}

int main (int argc, char **argv) {
	/* Before any thread exists.  */
	auto cc = curl_global_init(CURL_GLOBAL_DEFAULT);
	if (cc != CURLE_OK) {
		std::cerr << "curl_global_init: "
			  << curl_easy_strerror(cc)
			  << std::endl;
		return 1;
	}
	auto code = io_main(argc, argv);
	auto rv = Ev::start(code);
	curl_global_cleanup();
	return rv;
}
