#ifndef REPROVE_MSG_LOG_HPP
#define REPROVE_MSG_LOG_HPP

#include"Reprove/log.hpp"
#include<string>

namespace Reprove { namespace Msg {

/** struct Reprove::Msg::Log
 *
 * @brief broadcast by `Reprove::log` for each log
 * message.
 */
struct Log {
	Reprove::LogLevel level;
	std::string message;
};

}}

#endif /* !defined(REPROVE_MSG_LOG_HPP) */
