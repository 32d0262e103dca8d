#include<Ev/Io.hpp>
#include<Ev/start.hpp>
#include<Reprove/Main.hpp>
#include<iostream>
#include<memory>
#include<stdlib.h>

namespace {

Ev::Io<int> io_main(int argc, char **argv) {
	auto arg_vec = std::vector<std::string>();
	for (int i = 0; i < argc; ++i) {
		arg_vec.push_back(std::string(argv[i]));
	}
	auto main_obj = std::make_shared<Reprove::Main>(
		arg_vec, std::cout, std::cerr,
		[](char const* name) { return (char const*) getenv(name); }
	);
	return main_obj->run().then([main_obj](int ec) {
		/* Ensures main_obj is alive!  */
		return Ev::lift(ec);
	});
}

}

int main (int argc, char **argv) {
	auto code = io_main(argc, argv);
	return Ev::start(code);
}
