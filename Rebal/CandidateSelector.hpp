#ifndef REBAL_CANDIDATESELECTOR_HPP
#define REBAL_CANDIDATESELECTOR_HPP

#include"Ln/Amount.hpp"
#include"Rebal/Channel.hpp"
#include<functional>
#include<vector>

namespace Ln { class Scid; }
namespace Rebal { struct Config; }

namespace Rebal {

/* A (source, destination) pair worth rebalancing.  */
struct Candidate {
	Rebal::Channel source;
	Rebal::Channel destination;
	/* From Rebal::plan_amount, never zero.  */
	Ln::Amount amount;
	/* Source surplus above ratio-high plus destination
	 * deficit below ratio-low.  */
	Ln::Amount deficiency;
};

/** Rebal::select_candidates
 *
 * @brief ranks the channel pairs that need
 * rebalancing.
 *
 * @desc A pair qualifies if both channels are
 * active with non-zero capacity, the source is
 * above `ratio-high`, the destination is below
 * `ratio-low`, they are distinct channels, the
 * peers pass the include/exclude lists, the peers
 * differ (unless `allow-same-peer`), the pair is
 * not `excluded`, and a viable amount exists.
 *
 * Ordering is by deficiency (largest first), then
 * by source channel id, then by destination
 * channel id, so the same input always gives the
 * same output.
 */
std::vector<Candidate>
select_candidates( std::vector<Rebal::Channel> const& channels
		 , Rebal::Config const& config
		 , std::function<bool( Ln::Scid const& source
				     , Ln::Scid const& destination
				     )> const& excluded
		 );

}

#endif /* !defined(REBAL_CANDIDATESELECTOR_HPP) */
