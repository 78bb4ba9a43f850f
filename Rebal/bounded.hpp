#ifndef REBAL_BOUNDED_HPP
#define REBAL_BOUNDED_HPP

#include"Ev/Io.hpp"
#include"Rebal/Mod/Waiter.hpp"
#include"Rebal/NodeIF.hpp"
#include"Util/Str.hpp"
#include<utility>

namespace Rebal {

/** Rebal::bounded
 *
 * @brief runs a node call, failing with
 * `ConnectivityError` if the node does not answer
 * within `timeout` seconds.
 */
template<typename a>
Ev::Io<a> bounded( Mod::Waiter& waiter
		 , double timeout
		 , Ev::Io<a> call
		 ) {
	return waiter.timed(timeout, std::move(call))
		.template catching<Mod::Waiter::TimedOut
				  >([timeout](Mod::Waiter::TimedOut const&) -> Ev::Io<a> {
		throw ConnectivityError(Util::Str::fmt(
			"Node did not answer within %.0f seconds",
			timeout
		));
	});
}

}

#endif /* !defined(REBAL_BOUNDED_HPP) */
