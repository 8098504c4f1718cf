#ifndef NET_FD_HPP
#define NET_FD_HPP

#include<cstddef>
#include<utility>

namespace Net {

/** class Net::Fd
 *
 * @brief RAII owner of a file descriptor: the lightningd
 * RPC socket, or a cursor file being read or replaced.
 *
 * @desc The destructor closes silently.  Code that must
 * know whether buffered data reached the disk calls
 * `close()` explicitly and checks its result.
 */
class Fd {
private:
	int fd;

public:
	Fd(std::nullptr_t = nullptr) : fd(-1) { }
	explicit Fd(int fd_) : fd(fd_) { }
	~Fd();

	/* Not copyable!  */
	Fd(Fd const&) =delete;
	Fd& operator=(Fd const&) =delete;
	/* Moveable.  */
	Fd(Fd&& o) : fd(o.release()) { }
	Fd& operator=(Fd&& o) {
		auto tmp = Fd(std::move(o));
		swap(tmp);
		return *this;
	}

	int get() const { return fd; }
	int release() {
		auto ret = fd;
		fd = -1;
		return ret;
	}
	void swap(Fd& o) {
		auto tmp = o.fd;
		o.fd = fd;
		fd = tmp;
	}

	/* Close now; return false (errno set) on failure.
	 * The object is empty afterwards either way.  */
	bool close();

	explicit
	operator bool() const { return fd >= 0; }
	bool operator!() const { return fd < 0; }
};

}

#endif /* !defined(NET_FD_HPP) */
