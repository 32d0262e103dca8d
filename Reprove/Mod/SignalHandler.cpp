#include"Ev/Io.hpp"
#include"Reprove/Mod/SignalHandler.hpp"
#include"Reprove/Shutdown.hpp"
#include"Reprove/log.hpp"
#include"S/Bus.hpp"
#include"Util/make_unique.hpp"
#include<ev.h>
#include<iostream>
#include<signal.h>
#include<unistd.h>

namespace Reprove { namespace Mod {

class SignalHandler::Impl {
private:
	S::Bus& bus;
	ev_signal sigint;
	ev_signal sigterm;
	bool is_interrupted;

	static
	void handler(EV_P_ ev_signal* w, int revents) {
		auto self = (Impl*) w->data;
		self->on_signal(w->signum);
	}

	void on_signal(int signum) {
		if (is_interrupted)
			_exit(130);
		is_interrupted = true;

		auto act = Reprove::log( bus, Warn
				       , "Interrupted by signal %d, stopping. "
					 "Interrupt again to exit at once."
				       , signum
				       ).then([this]() {
			return bus.raise(Reprove::Shutdown());
		});
		act.run([]() { }, [](std::exception_ptr e) {
			std::cerr << "reprove: error: during shutdown: ";
			try {
				std::rethrow_exception(e);
			} catch (std::exception const& e) {
				std::cerr << e.what() << std::endl;
			} catch (...) {
				std::cerr << "unknown exception" << std::endl;
			}
		});
	}

public:
	explicit
	Impl(S::Bus& bus_) : bus(bus_), is_interrupted(false) {
		ev_signal_init(&sigint, &handler, SIGINT);
		sigint.data = this;
		ev_signal_init(&sigterm, &handler, SIGTERM);
		sigterm.data = this;

		ev_signal_start(EV_DEFAULT_ &sigint);
		ev_unref(EV_DEFAULT);
		ev_signal_start(EV_DEFAULT_ &sigterm);
		ev_unref(EV_DEFAULT);
	}
	~Impl() {
		ev_ref(EV_DEFAULT);
		ev_signal_stop(EV_DEFAULT_ &sigint);
		ev_ref(EV_DEFAULT);
		ev_signal_stop(EV_DEFAULT_ &sigterm);
	}

	bool interrupted() const { return is_interrupted; }
};

SignalHandler::SignalHandler(S::Bus& bus)
	: pimpl(Util::make_unique<Impl>(bus)) { }
SignalHandler::~SignalHandler() =default;

bool SignalHandler::interrupted() const {
	return pimpl->interrupted();
}

}}
