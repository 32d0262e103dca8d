#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/coroutine.hpp"
#include"Ev/now.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include"Reprove/Mod/Waiter.hpp"
#include"Reprove/Shutdown.hpp"
#include"S/Bus.hpp"
#include<assert.h>

namespace {

Ev::Io<bool> yield_true() {
	co_await Ev::yield();
	co_return true;
}

Ev::Io<bool> long_wait(Reprove::Mod::Waiter& waiter) {
	co_await waiter.wait(60);
	co_return true;
}

Ev::Io<int> test(S::Bus& bus, Reprove::Mod::Waiter& waiter) {
	/* Trivial timed.  */
	auto i = co_await waiter.timed(60, Ev::lift(42));
	assert(i == 42);
	assert(waiter.pending() == 0);

	/* Core operation delays, but completes first.  */
	auto start = Ev::now();
	co_await waiter.timed(60, waiter.wait(0.01));
	assert(Ev::now() - start >= 0.005);
	assert(waiter.pending() == 0);

	/* Timeout reached first.  */
	auto timed_out = false;
	try {
		co_await waiter.timed(0.001, long_wait(waiter));
	} catch (Reprove::Mod::Waiter::TimedOut const&) {
		timed_out = true;
	}
	assert(timed_out);
	/* The long wait itself goes on.  */
	assert(waiter.pending() == 1);

	/* Many in sequence, each finishing before its
	 * timeout.  */
	for (auto n = 0; n < 1000; ++n) {
		auto flag = co_await waiter.timed(60, yield_true());
		assert(flag);
	}
	assert(waiter.pending() == 1);

	/* Shutdown cancels pending waits, and any
	 * later ones.  */
	co_await bus.raise(Reprove::Shutdown());
	assert(waiter.pending() == 0);
	auto shut = false;
	try {
		co_await waiter.wait(1);
	} catch (Reprove::Shutdown const&) {
		shut = true;
	}
	assert(shut);

	co_return 0;
}

}

int main() {
	auto bus = S::Bus();
	auto waiter = Reprove::Mod::Waiter(bus);
	return Ev::start(Ev::lift().then([&]() {
		return test(bus, waiter);
	}));
}
