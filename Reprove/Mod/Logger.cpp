#include"Ev/Io.hpp"
#include"Reprove/Mod/Logger.hpp"
#include"Reprove/Msg/Log.hpp"
#include"S/Bus.hpp"

namespace Reprove { namespace Mod {

Logger::Logger( S::Bus& bus
	      , std::ostream& os_
	      , Reprove::LogLevel min_level_
	      ) : os(os_), min_level(min_level_) {
	bus.subscribe<Msg::Log>([this](Msg::Log const& l) {
		if (l.level < min_level)
			return Ev::lift();
		/* Keep each message on a single line.  */
		auto message = l.message;
		for (auto& c : message)
			if (c == '\n')
				c = ' ';
		os << "reprove: " << log_level_name(l.level) << ": "
		   << message << std::endl;
		return Ev::lift();
	});
}

}}
