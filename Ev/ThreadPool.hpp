#ifndef EV_THREADPOOL_HPP
#define EV_THREADPOOL_HPP

#include<functional>
#include<memory>
#include"Ev/Io.hpp"

namespace Ev {

/* Runs blocking work off the main loop.
 * HTTP transfers and hashing of large program
 * binaries go here, and the calling greenthread
 * is suspended until the result is handed back
 * on the main thread.
 * The pool size is fixed; it is not meant for
 * spreading compute across cores.
 */
class ThreadPool {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

	/* i.e. this accepts a function of type
	 * () -> () -> ()
	 * The first stage is executed in a
	 * background thread.
	 * The second stage is executed in
	 * the main thread.
	 */
	void add(std::function<std::function<void()>()>);

public:
	ThreadPool();
	~ThreadPool();
	ThreadPool(ThreadPool const&) =delete;
	ThreadPool(ThreadPool&&) =delete;

	template<typename a>
	Ev::Io<a> background(std::function<a()> func) {
		auto funptr = std::make_shared<std::function<a()>>
			( std::move(func) );
		return Ev::Io<a>([ funptr
				 , this
				 ]( std::function<void(a)> pass
				  , std::function<void(std::exception_ptr)> fail
				  ) {
			auto stage1 = [funptr, pass, fail]() {
				auto stage2 = std::function<void()>();
				try {
					auto res = std::make_shared<a>(
						(*funptr)()
					);
					stage2 = [pass, res]() {
						pass(std::move(*res));
					};
				} catch (...) {
					auto e = std::current_exception();
					stage2 = [fail, e]() {
						fail(e);
					};
				}
				return stage2;
			};
			add(stage1);
		});
	}
};

}

#endif /* EV_THREADPOOL_HPP */
