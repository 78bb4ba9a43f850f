#ifndef REBAL_SHUTDOWN_HPP
#define REBAL_SHUTDOWN_HPP

namespace Rebal {

/** struct Rebal::Shutdown
 *
 * @brief raised on the bus when the program is
 * exiting, and thrown by blocking Ev::Io
 * operations (waits) that get cancelled by it.
 */
struct Shutdown {};

}

#endif /* !defined(REBAL_SHUTDOWN_HPP) */
