#undef NDEBUG
#include"Build/Error.hpp"
#include"Build/OutputDir.hpp"
#include<assert.h>
#include<stdlib.h>
#include<sys/stat.h>
#include<unistd.h>

namespace {

bool exists(std::string const& path) {
	struct stat st;
	return stat(path.c_str(), &st) == 0;
}

}

int main() {
	auto base = Build::OutputDir();
	assert(base.get()[0] == '/');
	assert(chdir(base.get().c_str()) == 0);

	/* A relative TMPDIR still gives an absolute path.  */
	assert(setenv("TMPDIR", ".", 1) == 0);
	auto path = std::string();
	{
		auto dir = Build::OutputDir();
		path = dir.get();
		assert(path[0] == '/');
		assert(path.find(base.get() + "/reprove-") == 0);
		assert(path.find("/./") == std::string::npos);
		assert(exists(path));
	}
	assert(!exists(path));
	assert(unsetenv("TMPDIR") == 0);

	/* Explicit removal reports success once.  */
	{
		auto dir = Build::OutputDir(base.get(), "x-");
		path = dir.get();
		assert(mkdir((path + "/nested").c_str(), 0755) == 0);
		assert(dir.remove());
		assert(!exists(path));
		assert(dir.get().empty());
		assert(dir.remove());
	}

	/* A tree that cannot be removed is reported.  */
	{
		auto dir = Build::OutputDir(base.get(), "y-");
		path = dir.get();
		assert(rmdir(path.c_str()) == 0);
		assert(!dir.remove());
	}

	/* Retained directories outlive the object.  */
	{
		auto dir = Build::OutputDir(base.get(), "z-");
		path = dir.get();
		dir.retain();
		assert(dir.remove());
	}
	assert(exists(path));
	assert(Build::remove_tree(path));
	assert(!exists(path));

	/* Resolution.  */
	assert(Build::absolute_path(base.get() + "/.") == base.get());
	auto flag = false;
	try {
		Build::absolute_path(base.get() + "/no-such");
	} catch (Build::ConfigError const&) {
		flag = true;
	}
	assert(flag);

	assert(chdir("/") == 0);
	return 0;
}
