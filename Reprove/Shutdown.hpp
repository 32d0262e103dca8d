#ifndef REPROVE_SHUTDOWN_HPP
#define REPROVE_SHUTDOWN_HPP

namespace Reprove {

/** struct Reprove::Shutdown
 *
 * @brief broadcast on the bus when the user
 * interrupts the process, and thrown by blocking
 * Ev::Io operations that were interrupted.
 */
struct Shutdown {};

}

#endif /* !defined(REPROVE_SHUTDOWN_HPP) */
