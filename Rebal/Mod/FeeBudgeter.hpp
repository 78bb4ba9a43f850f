#ifndef REBAL_MOD_FEEBUDGETER_HPP
#define REBAL_MOD_FEEBUDGETER_HPP

#include"Ln/Amount.hpp"
#include"Util/BacktraceException.hpp"
#include<memory>
#include<stdexcept>
#include<string>

namespace Ev { template<typename a> class Io; }
namespace Rebal { struct Config; }
namespace S { class Bus; }

namespace Rebal {

/** Rebal::NoBudgetError
 *
 * @brief the fee we may pay for an attempt is
 * below what the attempt needs.
 * The attempt is deferred, it is not a failure.
 */
class NoBudgetError : public Util::BacktraceException<std::runtime_error> {
public:
	explicit
	NoBudgetError(std::string const& e
		     ) : Util::BacktraceException<std::runtime_error>(e) { }
};

}

namespace Rebal { namespace Mod {

/** class Rebal::Mod::FeeBudgeter
 *
 * @brief keeps the fee ledger of the current
 * budget epoch and decides how much fee each
 * rebalance may pay.
 *
 * @desc Epochs are numbered `floor(now / epoch)`,
 * the ledger resets when the number changes.
 * Amounts held for ambiguous attempts count as
 * spent until they are settled.
 * The ledger is persisted once `Msg::DbResource`
 * is raised.
 */
class FeeBudgeter {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	FeeBudgeter() =delete;
	FeeBudgeter(FeeBudgeter&&);
	~FeeBudgeter();

	FeeBudgeter( S::Bus& bus
		   , Rebal::Config const& config
		   );

	/** Rebal::Mod::FeeBudgeter::authorize
	 *
	 * @brief returns the fee ceiling for
	 * rebalancing `amount` along a route the node
	 * estimates will cost `route_fee`.
	 *
	 * @desc The ceiling is the least of the flat
	 * per-attempt cap, the percentage of `amount`,
	 * and what remains of the epoch budget.
	 * Throws NoBudgetError if the ceiling is below
	 * both `min-fee` and `route_fee`.
	 */
	Ev::Io<Ln::Amount> authorize( Ln::Amount amount
				    , Ln::Amount route_fee
				    , double now
				    );
	/* Records a fee actually paid.  */
	Ev::Io<void> charge(Ln::Amount fee, double now);
	/* Reserves the ceiling of an ambiguous attempt.  */
	Ev::Io<void> hold( std::string const& attempt_id
			 , Ln::Amount ceiling
			 , double now
			 );
	/* Replaces the hold of an attempt with the fee
	 * it actually paid, or releases it if the
	 * attempt failed.
	 * Holds from earlier epochs are just dropped.  */
	Ev::Io<void> settle( std::string const& attempt_id
			   , bool succeeded
			   , Ln::Amount actual
			   , double now
			   );

	/* Of the epoch last seen.  */
	Ln::Amount spent() const;
	Ln::Amount remaining() const;
};

}}

#endif /* !defined(REBAL_MOD_FEEBUDGETER_HPP) */
