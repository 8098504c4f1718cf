#include"Net/Fd.hpp"
#include"Util/BacktraceException.hpp"
#include"Zap/open_rpc_socket.hpp"
#include<errno.h>
#include<stdexcept>
#include<string.h>
#include<sys/socket.h>
#include<sys/types.h>
#include<sys/un.h>
#include<unistd.h>

namespace {

[[noreturn]]
void fail(char const* what, int err) {
	throw Util::BacktraceException<std::runtime_error>(
		std::string("open_rpc_socket: ") + what + ": " + strerror(err)
	);
}

}

namespace Zap {

Net::Fd open_rpc_socket( std::string const& lightning_dir
		       , std::string const& rpc_file
		       ) {
	if (chdir(lightning_dir.c_str()) < 0)
		fail("chdir", errno);

	auto fd = Net::Fd(socket(AF_UNIX, SOCK_STREAM, 0));
	if (!fd)
		fail("socket", errno);

	auto addr = sockaddr_un();
	if (rpc_file.length() + 1 > sizeof(addr.sun_path))
		fail("sizeof(sun_path)", ENOSPC);

	strcpy(addr.sun_path, rpc_file.c_str());
	addr.sun_family = AF_UNIX;

	auto res = int();
	do {
		res = connect( fd.get()
			     , reinterpret_cast<sockaddr const*>(&addr)
			     , sizeof(addr)
			     );
	} while (res < 0 && errno == EINTR);
	if (res < 0)
		fail("connect", errno);

	return fd;
}

}
