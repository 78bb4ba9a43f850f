#ifndef REBAL_MOD_SCHEDULER_HPP
#define REBAL_MOD_SCHEDULER_HPP

#include<cstddef>
#include<memory>

namespace Ev { template<typename a> class Io; }
namespace Rebal { struct Config; }
namespace Rebal { namespace Mod { class AttemptHistory; }}
namespace Rebal { namespace Mod { class BackoffController; }}
namespace Rebal { namespace Mod { class ChannelMonitor; }}
namespace Rebal { namespace Mod { class FeeBudgeter; }}
namespace Rebal { namespace Mod { class PaymentExecutor; }}
namespace Rebal { namespace Mod { class RoutePlanner; }}
namespace Rebal { namespace Mod { class Waiter; }}
namespace S { class Bus; }

namespace Rebal { namespace Mod {

/** class Rebal::Mod::Scheduler
 *
 * @brief runs rebalancing passes every
 * `poll-interval` seconds until a
 * `Msg::ShutdownRequest`.
 *
 * @desc A pass first re-queries attempts left
 * Ambiguous by earlier passes, then fetches the
 * channels, selects candidates, and attempts up
 * to `max-candidates` of them one at a time.
 * A candidate touching a channel rebalanced
 * earlier in the same pass is skipped.
 * If the node cannot be reached the pass is
 * abandoned until the next interval.
 *
 * A shutdown request lets the current attempt
 * finish, then `run` returns.
 */
class Scheduler {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Scheduler() =delete;
	Scheduler(Scheduler&&);
	~Scheduler();

	Scheduler( S::Bus& bus
		 , Mod::Waiter& waiter
		 , Rebal::Config const& config
		 , Mod::ChannelMonitor& monitor
		 , Mod::RoutePlanner& planner
		 , Mod::FeeBudgeter& budget
		 , Mod::PaymentExecutor& executor
		 , Mod::BackoffController& backoff
		 , Mod::AttemptHistory& history
		 );

	/* Passes until a shutdown is requested.  */
	Ev::Io<void> run();
	/* A single pass.  */
	Ev::Io<void> pass();

	/* Gives up on every attempt still Ambiguous,
	 * then clears capped and ambiguous exclusions.
	 * Returns how many exclusions were cleared.  */
	Ev::Io<std::size_t> reset_exclusions();
};

}}

#endif /* !defined(REBAL_MOD_SCHEDULER_HPP) */
