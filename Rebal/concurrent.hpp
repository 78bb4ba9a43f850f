#ifndef REBAL_CONCURRENT_HPP
#define REBAL_CONCURRENT_HPP

namespace Ev { template<typename a> class Io; }

namespace Rebal {

/** Rebal::concurrent.
 *
 * @brief Like Ev::concurrent except it ignores
 * Rebal::Shutdown exceptions in the new greenthread.
 */
Ev::Io<void> concurrent(Ev::Io<void>);

}

#endif /* !defined(REBAL_CONCURRENT_HPP) */
