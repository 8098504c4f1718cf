#include"Net/Fd.hpp"
#include"Util/Rw.hpp"
#include"Util/Str.hpp"
#include"Zap/CursorStore.hpp"
#include<errno.h>
#include<fcntl.h>
#include<string.h>
#include<sys/stat.h>
#include<sys/types.h>
#include<unistd.h>
#include<vector>

namespace {

[[noreturn]]
void fail(std::string const& what, std::string const& path, int err) {
	throw Util::BacktraceException<std::runtime_error>(
		"CursorStore: " + what + " " + path + ": " + strerror(err)
	);
}

std::string dirname_of(std::string const& path) {
	auto pos = path.rfind('/');
	if (pos == std::string::npos)
		return ".";
	if (pos == 0)
		return "/";
	return path.substr(0, pos);
}

/* mkdir -p.  */
void make_dirs(std::string const& dir) {
	if (dir == "." || dir == "/")
		return;
	struct stat st{};
	if (stat(dir.c_str(), &st) == 0) {
		if (!S_ISDIR(st.st_mode))
			fail("not a directory:", dir, ENOTDIR);
		return;
	}
	make_dirs(dirname_of(dir));
	if (mkdir(dir.c_str(), 0700) < 0 && errno != EEXIST)
		fail("mkdir", dir, errno);
}

void fsync_fd(Net::Fd const& fd, std::string const& path) {
	auto res = int();
	do {
		res = fsync(fd.get());
	} while (res < 0 && errno == EINTR);
	if (res < 0)
		fail("fsync", path, errno);
}

}

namespace Zap {

std::uint64_t CursorStore::load() const {
	auto fd = Net::Fd(open(path.c_str(), O_RDONLY | O_CLOEXEC));
	if (!fd) {
		if (errno == ENOENT)
			return default_index;
		throw CursorCorruption(path + ": " + strerror(errno));
	}

	auto content = std::vector<std::uint8_t>();
	if (!Util::Rw::read_to_end(fd.get(), content))
		throw CursorCorruption(path + ": read: " + strerror(errno));

	auto text = std::string(content.begin(), content.end());
	if (text.size() >= 2 && text.back() == '\n') {
		text.pop_back();
		auto rv = std::uint64_t();
		if (Util::Str::parse_u64(text, rv))
			return rv;
	}
	if (content.size() == sizeof(std::uint64_t)) {
		auto rv = std::uint64_t();
		memcpy(&rv, content.data(), sizeof(rv));
		return rv;
	}
	throw CursorCorruption( path + ": unrecognized content ("
			      + std::to_string(content.size())
			      + " bytes)"
			      );
}

void CursorStore::save(std::uint64_t index) const {
	auto dir = dirname_of(path);
	make_dirs(dir);

	auto tmp = path + ".tmp";
	auto text = std::to_string(index) + "\n";
	{
		auto fd = Net::Fd(open( tmp.c_str()
				      , O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC
				      , 0600
				      ));
		if (!fd)
			fail("open", tmp, errno);
		if (!Util::Rw::write_all(fd.get(), text.data(), text.size()))
			fail("write", tmp, errno);
		fsync_fd(fd, tmp);
		if (!fd.close())
			fail("close", tmp, errno);
	}
	if (rename(tmp.c_str(), path.c_str()) < 0)
		fail("rename", tmp, errno);

	auto dfd = Net::Fd(open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
	if (!dfd)
		fail("open", dir, errno);
	fsync_fd(dfd, dir);
}

}
