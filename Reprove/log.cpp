#include"Ev/Io.hpp"
#include"Reprove/Msg/Log.hpp"
#include"Reprove/log.hpp"
#include"S/Bus.hpp"
#include"Util/format.hpp"
#include<stdarg.h>

namespace Reprove {

Ev::Io<void> log(S::Bus& bus, LogLevel l, const char *fmt, ...) {
	va_list ap;
	auto msg = std::string();

	va_start(ap, fmt);
	msg = Util::vformat(fmt, ap);
	va_end(ap);

	return bus.raise(Reprove::Msg::Log{l, std::move(msg)});
}

char const* log_level_name(LogLevel l) {
	switch (l) {
	case Trace: return "trace";
	case Debug: return "debug";
	case Info: return "info";
	case Warn: return "warn";
	case Error: return "error";
	}
	return "unknown";
}

bool parse_log_level(std::string const& name, LogLevel& l) {
	for (auto c : {Trace, Debug, Info, Warn, Error}) {
		if (name == log_level_name(c)) {
			l = c;
			return true;
		}
	}
	return false;
}

}
