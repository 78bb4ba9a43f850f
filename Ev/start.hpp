#ifndef EV_START_HPP
#define EV_START_HPP

namespace Ev { template<typename a> class Io; }

namespace Ev {

/** Ev::start
 *
 * @brief runs the given action in the default libev
 * loop, returning its exit code once the loop has
 * no more active watchers.
 */
int start(Io<int> main);

}

#endif /* !defined(EV_START_HPP) */
