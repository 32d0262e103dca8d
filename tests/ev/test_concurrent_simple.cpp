#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include<assert.h>
#include<vector>

int main() {
	auto order = std::vector<int>();
	auto ec = Ev::start(Ev::yield().then([&]() {
		return Ev::concurrent(Ev::yield().then([&]() {
			order.push_back(2);
			return Ev::lift();
		}));
	}).then([&]() {
		/* The launched task has not run yet.  */
		assert(order.empty());
		order.push_back(1);
		return Ev::yield();
	}).then([&]() {
		return Ev::yield();
	}).then([&]() {
		assert((order == std::vector<int>{1, 2}));
		return Ev::lift(0);
	}));

	return ec;
}
