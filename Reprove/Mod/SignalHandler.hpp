#ifndef REPROVE_MOD_SIGNALHANDLER_HPP
#define REPROVE_MOD_SIGNALHANDLER_HPP

#include<memory>

namespace S { class Bus; }

namespace Reprove { namespace Mod {

/** class Reprove::Mod::SignalHandler
 *
 * @brief turns SIGINT and SIGTERM into a
 * `Reprove::Shutdown` broadcast on the bus.
 *
 * @desc The watchers do not keep the main loop
 * alive by themselves.
 * A second signal terminates the process at once
 * with exit code 130.
 * The watchers are stopped on destruction.
 */
class SignalHandler {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	SignalHandler() =delete;
	SignalHandler(SignalHandler const&) =delete;

	explicit
	SignalHandler(S::Bus& bus);
	~SignalHandler();

	/* Whether a signal has been received.  */
	bool interrupted() const;
};

}}

#endif /* !defined(REPROVE_MOD_SIGNALHANDLER_HPP) */
