#ifndef REBAL_MOD_PAYMENTEXECUTOR_HPP
#define REBAL_MOD_PAYMENTEXECUTOR_HPP

#include"Ln/Amount.hpp"
#include"Util/BacktraceException.hpp"
#include<memory>
#include<stdexcept>
#include<string>

namespace Ev { template<typename a> class Io; }
namespace Rebal { class NodeIF; }
namespace Rebal { struct Config; }
namespace Rebal { struct Plan; }
namespace Rebal { struct RebalanceAttempt; }
namespace Rebal { namespace Mod { class FeeBudgeter; }}
namespace Rebal { namespace Mod { class Waiter; }}
namespace S { class Bus; }

namespace Rebal {

/** Rebal::AmbiguousOutcome
 *
 * @brief we could not learn whether a submitted
 * payment went through.
 */
class AmbiguousOutcome : public Util::BacktraceException<std::runtime_error> {
public:
	explicit
	AmbiguousOutcome(std::string const& e
			) : Util::BacktraceException<std::runtime_error>(e) { }
};

}

namespace Rebal { namespace Mod {

/** class Rebal::Mod::PaymentExecutor
 *
 * @brief performs a planned rebalance as a
 * payment to ourselves, and follows it until we
 * know how it ended.
 *
 * @desc The payment status is polled with growing
 * intervals until `status-poll-timeout`.
 * If the outcome is still unknown by then, or if
 * the node could not be reached while submitting,
 * the attempt becomes Ambiguous: its fee ceiling
 * is held in the budget and the status is queried
 * again up to `reconcile-attempts` times.
 * A payment is never submitted twice.
 *
 * Every finished attempt is announced with
 * `Msg::AttemptResolved`.
 * Failing to create the invoice throws, since
 * nothing was attempted.
 */
class PaymentExecutor {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	PaymentExecutor() =delete;
	PaymentExecutor(PaymentExecutor&&);
	~PaymentExecutor();

	PaymentExecutor( S::Bus& bus
		       , Mod::Waiter& waiter
		       , Rebal::Config const& config
		       , Rebal::NodeIF& node
		       , Mod::FeeBudgeter& budget
		       );

	Ev::Io<Rebal::RebalanceAttempt>
	execute( Rebal::Plan const& plan
	       , Ln::Amount fee_ceiling
	       );

	/** Rebal::Mod::PaymentExecutor::requery
	 *
	 * @brief queries the status of an attempt left
	 * Ambiguous once, settling it if the node now
	 * knows how it ended.
	 */
	Ev::Io<Rebal::RebalanceAttempt>
	requery(Rebal::RebalanceAttempt const& attempt);

	/* Gives up on an Ambiguous attempt: it is marked
	 * Failed, its hold released and its invoice
	 * deleted.  */
	Ev::Io<Rebal::RebalanceAttempt>
	abandon(Rebal::RebalanceAttempt const& attempt);
};

}}

#endif /* !defined(REBAL_MOD_PAYMENTEXECUTOR_HPP) */
