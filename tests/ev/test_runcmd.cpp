#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/coroutine.hpp"
#include"Ev/runcmd.hpp"
#include"Ev/start.hpp"
#include<assert.h>
#include<stdexcept>

namespace {

Ev::Io<int> test() {
	/* Should be an empty string, since input is /dev/null.  */
	auto cat = co_await Ev::runcmd("cat", {});
	assert(cat == "");

	/* Large output.  */
	auto argv1 = std::vector<std::string>{"-c", "seq 1 20000"};
	auto seq = co_await Ev::runcmd("sh", std::move(argv1));
	assert(seq.size() > 20000);
	assert(seq.substr(0, 4) == "1\n2\n");

	/* Exit codes are results, not errors.  */
	auto argv2 = std::vector<std::string>{"-c", "echo out; exit 3"};
	auto res = co_await Ev::runcmd_status("sh", std::move(argv2));
	assert(res.exit_code == 3);
	assert(res.output == "out\n");

	/* stderr is captured only when asked.  */
	auto argv3 = std::vector<std::string>{"-c", "echo err >&2"};
	res = co_await Ev::runcmd_status( "sh", std::move(argv3)
					, true
					);
	assert(res.exit_code == 0);
	assert(res.output == "err\n");
	auto argv4 = std::vector<std::string>{"-c", "echo err >&2"};
	res = co_await Ev::runcmd_status( "sh", std::move(argv4)
					, false
					);
	assert(res.output == "");

	/* Killed by a signal.  */
	auto argv5 = std::vector<std::string>{"-c", "kill -9 $$"};
	res = co_await Ev::runcmd_status("sh", std::move(argv5));
	assert(res.exit_code == 128 + 9);

	/* runcmd throws on non-zero exit, keeping the output.  */
	auto flag = false;
	try {
		auto argv6 = std::vector<std::string>{"-c", "echo partial; exit 2"};
		co_await Ev::runcmd("sh", std::move(argv6));
	} catch (Ev::RunCmdError const& e) {
		flag = true;
		assert(e.exit_code == 2);
		assert(e.output == "partial\n");
	}
	assert(flag);

	/* Non-existent command.  */
	flag = false;
	try {
		co_await Ev::runcmd_status("test-on-nonexistent-command", {});
	} catch (Ev::RunCmdError const& e) {
		flag = true;
		assert(e.exit_code == -1);
	}
	assert(flag);

	co_return 0;
}

}

int main() {
	return Ev::start(Ev::lift().then([]() {
		return test();
	}));
}
