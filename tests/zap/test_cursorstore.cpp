#undef NDEBUG
#include"Zap/CursorStore.hpp"
#include<assert.h>
#include<cstdint>
#include<fcntl.h>
#include<fstream>
#include<sstream>
#include<stdlib.h>
#include<string.h>
#include<sys/stat.h>
#include<unistd.h>

namespace {

std::string slurp(std::string const& path) {
	auto is = std::ifstream(path);
	auto ss = std::ostringstream();
	ss << is.rdbuf();
	return ss.str();
}

void spew(std::string const& path, void const* p, std::size_t n) {
	auto os = std::ofstream(path, std::ios::binary | std::ios::trunc);
	os.write((char const*) p, std::streamsize(n));
}

bool corrupt(Zap::CursorStore const& store) {
	try {
		store.load();
	} catch (Zap::CursorCorruption const&) {
		return true;
	}
	return false;
}

}

int main() {
	char tmpl[] = "/tmp/clzap-test-cursor-XXXXXX";
	auto dir = std::string(mkdtemp(tmpl));

	{
		/* No file yet: start from the configured index.  */
		auto store = Zap::CursorStore(dir + "/cursor", 17);
		assert(store.load() == 17);

		store.save(42);
		assert(slurp(dir + "/cursor") == "42\n");
		assert(store.load() == 42);
		/* No temporary left behind.  */
		assert(access((dir + "/cursor.tmp").c_str(), F_OK) != 0);

		store.save(18446744073709551615ULL);
		assert(store.load() == 18446744073709551615ULL);
	}

	{
		/* Parent directories are created.  */
		auto store = Zap::CursorStore(dir + "/a/b/cursor", 0);
		assert(store.load() == 0);
		store.save(5);
		assert(store.load() == 5);
		unlink((dir + "/a/b/cursor").c_str());
		rmdir((dir + "/a/b").c_str());
		rmdir((dir + "/a").c_str());
	}

	{
		/* Binary file from older versions.  */
		auto path = dir + "/legacy";
		auto v = std::uint64_t(1234567);
		spew(path, &v, sizeof(v));
		auto store = Zap::CursorStore(path, 0);
		assert(store.load() == 1234567);
		store.save(1234568);
		assert(slurp(path) == "1234568\n");
		unlink(path.c_str());
	}

	{
		auto path = dir + "/bad";
		auto store = Zap::CursorStore(path, 0);

		spew(path, "", 0);
		assert(corrupt(store));
		spew(path, "abc\n", 4);
		assert(corrupt(store));
		spew(path, "\n", 1);
		assert(corrupt(store));
		spew(path, "12", 2);
		assert(corrupt(store));
		spew(path, "-3\n", 3);
		assert(corrupt(store));
		spew(path, "99999999999999999999\n", 21);
		assert(corrupt(store));
		unlink(path.c_str());

		/* A directory in the way.  */
		mkdir(path.c_str(), 0700);
		assert(corrupt(store));
		rmdir(path.c_str());
	}

	unlink((dir + "/cursor").c_str());
	rmdir(dir.c_str());
	return 0;
}
