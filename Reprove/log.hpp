#ifndef REPROVE_LOG_HPP
#define REPROVE_LOG_HPP

#ifdef HAVE_CONFIG_H
# include"config.h"
#endif
#include<string>

namespace Ev { template<typename a> class Io; }
namespace S { class Bus; }

namespace Reprove {

enum LogLevel {
	Trace,
	Debug,
	Info,
	Warn,
	Error
};

/** Reprove::log
 *
 * @brief formats a message printf-style and raises
 * it as a `Reprove::Msg::Log` on the bus.
 */
Ev::Io<void> log(S::Bus& bus, LogLevel l, const char *fmt, ...)
#if HAVE_ATTRIBUTE_FORMAT
	__attribute__ ((format (printf, 3, 4)))
#endif
;

/* Conversions to and from the names used on the
 * command line.  */
char const* log_level_name(LogLevel l);
/* Returns false if the name is not a level.  */
bool parse_log_level(std::string const& name, LogLevel& l);

}

#endif /* REPROVE_LOG_HPP */
