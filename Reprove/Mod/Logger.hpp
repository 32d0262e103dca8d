#ifndef REPROVE_MOD_LOGGER_HPP
#define REPROVE_MOD_LOGGER_HPP

#include"Reprove/log.hpp"
#include<ostream>

namespace S { class Bus; }

namespace Reprove { namespace Mod {

/** class Reprove::Mod::Logger
 *
 * @brief writes `Reprove::Msg::Log` messages at or
 * above the given level to the given stream.
 *
 * @desc Each message is one line of the form
 * `reprove: <level>: <message>`.
 */
class Logger {
private:
	std::ostream& os;
	Reprove::LogLevel min_level;

public:
	Logger() =delete;
	Logger(Logger const&) =delete;

	Logger( S::Bus& bus
	      , std::ostream& os
	      , Reprove::LogLevel min_level = Reprove::Info
	      );
};

}}

#endif /* !defined(REPROVE_MOD_LOGGER_HPP) */
