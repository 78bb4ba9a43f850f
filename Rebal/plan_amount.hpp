#ifndef REBAL_PLAN_AMOUNT_HPP
#define REBAL_PLAN_AMOUNT_HPP

#include"Ln/Amount.hpp"

namespace Rebal { struct Channel; }
namespace Rebal { struct Config; }

namespace Rebal {

/** Rebal::plan_amount
 *
 * @brief computes how much to move from `source`
 * to `destination`.
 *
 * @desc The amount is the least of:
 *
 * - what the source holds locally above
 *   `ratio-high` of its capacity, minus the
 *   reserve margin;
 * - what the destination holds remotely above
 *   `ratio-low` of its capacity, minus the
 *   reserve margin;
 * - `max-amount`.
 *
 * Returns zero if that is below `min-amount`,
 * in which case the pair is not viable.
 */
Ln::Amount plan_amount( Rebal::Channel const& source
		      , Rebal::Channel const& destination
		      , Rebal::Config const& config
		      );

}

#endif /* !defined(REBAL_PLAN_AMOUNT_HPP) */
