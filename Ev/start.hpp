#ifndef EV_START_HPP
#define EV_START_HPP

namespace Ev { template<typename a> class Io; }

namespace Ev {

/** Ev::start
 *
 * @brief runs the main loop with the given action
 * as the main greenthread.
 *
 * @return the exit code returned by the action, or
 * 254 if the action threw an unhandled exception,
 * or 255 if the loop could not be initialized.
 */
int start(Ev::Io<int> main);

}

#endif /* !defined(EV_START_HPP) */
