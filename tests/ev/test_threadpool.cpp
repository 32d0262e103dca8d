#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/ThreadPool.hpp"
#include"Ev/coroutine.hpp"
#include"Ev/start.hpp"
#include"Sha256/fun.hpp"
#include<assert.h>
#include<sodium/core.h>
#include<stdexcept>
#include<string>
#include<thread>

namespace {

Ev::Io<int> test(Ev::ThreadPool& pool) {
	auto main_id = std::this_thread::get_id();

	/* Work runs elsewhere, the result arrives back on
	 * the main thread.  */
	auto worker_id = main_id;
	auto h = co_await pool.background<Sha256::Hash>([&worker_id]() {
		worker_id = std::this_thread::get_id();
		return Sha256::fun(std::string(1 << 20, '\0'));
	});
	assert(worker_id != main_id);
	assert(std::this_thread::get_id() == main_id);
	assert(h == Sha256::fun(std::string(1 << 20, '\0')));

	/* Exceptions cross back too.  */
	auto failed = false;
	try {
		co_await pool.background<int>([]() -> int {
			throw std::runtime_error("disk full");
		});
	} catch (std::runtime_error const& e) {
		failed = std::string(e.what()) == "disk full";
	}
	assert(failed);

	/* Reusable after a failure.  */
	auto sum = 0;
	for (auto i = 0; i < 50; ++i)
		sum += co_await pool.background<int>([i]() { return i; });
	assert(sum == 50 * 49 / 2);

	co_return 0;
}

}

int main() {
	assert(sodium_init() >= 0);
	auto pool = Ev::ThreadPool();
	return Ev::start(Ev::lift().then([&]() {
		return test(pool);
	}));
}
