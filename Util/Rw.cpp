#include"Util/Rw.hpp"
#include<errno.h>
#include<unistd.h>

namespace {

bool transient(int err) {
	return err == EINTR || err == EWOULDBLOCK || err == EAGAIN;
}

}

namespace Util { namespace Rw {

bool write_all(int fd, void const* vp, std::size_t s) {
	auto p = (char const*) vp;
	while (s > 0) {
		auto res = write(fd, p, s);
		if (res < 0) {
			if (transient(errno))
				continue;
			return false;
		}
		s -= std::size_t(res);
		p += res;
	}
	return true;
}

bool read_to_end(int fd, std::vector<std::uint8_t>& out) {
	std::uint8_t buf[4096];
	for (;;) {
		auto res = read(fd, buf, sizeof(buf));
		if (res < 0) {
			if (transient(errno))
				continue;
			return false;
		}
		if (res == 0)
			return true;
		out.insert(out.end(), buf, buf + res);
	}
}

}}
