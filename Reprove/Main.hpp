#ifndef REPROVE_MAIN_HPP
#define REPROVE_MAIN_HPP

#include"Reprove/Config.hpp"
#include<memory>
#include<ostream>
#include<string>
#include<vector>

namespace Ev { template<typename a> class Io; }

namespace Reprove {

class Main {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Main() = delete;
	Main( std::vector<std::string> argv
	    , std::ostream& cout
	    , std::ostream& cerr
	    , Config::Env getenv
	    );
	Main(Main&&);
	~Main();

	/* Runs the command, returning the exit code.  */
	Ev::Io<int> run();
};

}

#endif /* !defined(REPROVE_MAIN_HPP) */
