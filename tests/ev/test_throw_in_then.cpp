#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include"Solana/ChainError.hpp"
#include<assert.h>
#include<string>

int main() {
	auto code = Ev::yield().then([]() {
		throw Solana::RpcError( Solana::RpcError::Transport
				      , true, 0
				      , "connection reset"
				      );
		return Ev::lift(1);
	}).catching<std::runtime_error>([](std::runtime_error const& e) {
		/* Caught as its base.  */
		assert(std::string(e.what()).find("connection reset")
		       != std::string::npos);
		return Ev::lift(0);
	}).then([](int c) {
		throw int(c + 42);
		return Ev::lift(1);
	}).catching<int>([](int i) {
		assert(i == 42);
		return Ev::lift(0);
	});
	return Ev::start(code);
}
