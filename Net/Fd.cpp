#include"Net/Fd.hpp"
#include<errno.h>
#include<unistd.h>
#include<utility>

namespace Net {

Fd::~Fd() {
	if (fd >= 0) {
		/* Keep errno intact for callers reporting
		 * an earlier failure.  */
		auto err = errno;
		::close(fd);
		errno = err;
	}
}

bool Fd::close() {
	if (fd < 0)
		return true;
	auto res = ::close(release());
	return res == 0;
}

}
