#ifndef REBAL_MOD_WAITER_HPP
#define REBAL_MOD_WAITER_HPP

#include"Ev/Io.hpp"
#include"Util/BacktraceException.hpp"
#include"Util/make_unique.hpp"
#include<memory>
#include<stdexcept>
#include<string>

namespace Ev { template<typename a> class Io;}
namespace S { class Bus; }

namespace Rebal { namespace Mod {

/** class Rebal::Mod::Waiter
 *
 * @brief timers for Ev::Io greenthreads, all of
 * which are cancelled when `Rebal::Shutdown` is
 * raised on the bus.
 */
class Waiter {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	explicit
	Waiter(S::Bus& bus);
	~Waiter();

	/** Rebal::Mod::Waiter::wait
	 *
	 * @brief Waits for the specified number of
	 * seconds, then the action returns.
	 * Throws a Rebal::Shutdown exception if a
	 * shutdown is broadcasted on the bus.
	 */
	Ev::Io<void> wait(double seconds);

	/** Rebal::Mod::Waiter::timed
	 *
	 * @brief performs the action, but if it does
	 * not complete before the given timeout,
	 * throws a `TimedOut` exception within the
	 * `Ev::Io` system.
	 *
	 * @desc `Ev::Io` does not really allow for
	 * cancelling of ongoing tasks, so the given
	 * action will still run to completion even if
	 * the timeout is reached, but the result will
	 * be destructed as soon as the action
	 * completes.
	 */
	template<typename a>
	Ev::Io<a> timed( double timeout
		       , Ev::Io<a> action
		       );
	class TimedOut : public Util::BacktraceException<std::runtime_error> {
	public:
		explicit
		TimedOut(double timeout)
			: Util::BacktraceException<std::runtime_error>(
				"Timed out after " + std::to_string(timeout)
			      + " seconds"
			  ) { }
	};

private:
	Ev::Io<void> timed_core( double timeout
			       , Ev::Io<void> action
			       );
};

template<typename a>
inline
Ev::Io<a> Waiter::timed( double timeout
		       , Ev::Io<a> action
		       ) {
	auto paction = std::make_shared<Ev::Io<a>>(
		std::move(action)
	);
	auto presult = std::make_shared<std::unique_ptr<a>>();
	return timed_core(timeout, Ev::lift().then([paction, presult]() {
		return paction->then([presult](a value) {
			*presult = Util::make_unique<a>(
				std::move(value)
			);
			return Ev::lift();
		});
	})).then([presult]() {
		return Ev::lift(std::move(**presult));
	});
}
template<>
inline
Ev::Io<void> Waiter::timed<void>( double timeout
				, Ev::Io<void> action
				) {
	return timed_core(timeout, action);
}

}}

#endif /* !defined(REBAL_MOD_WAITER_HPP) */
