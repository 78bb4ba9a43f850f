#ifndef REBAL_CHANNEL_HPP
#define REBAL_CHANNEL_HPP

#include"Ln/Amount.hpp"
#include"Ln/NodeId.hpp"
#include"Ln/Scid.hpp"

namespace Rebal {

/** struct Rebal::Channel
 *
 * @brief a snapshot of one of our channels, as
 * reported by the node.
 *
 * @desc local + remote never exceeds capacity;
 * records that would violate this are dropped
 * by the channel monitor.
 */
struct Channel {
	Ln::Scid id;
	Ln::NodeId peer;
	Ln::Amount capacity;
	Ln::Amount local;
	Ln::Amount remote;
	bool active;
	/* Time of the last successful rebalance
	 * touching this channel, 0 if never.  */
	double last_success;

	/* Fraction of capacity on our side.  */
	double local_ratio() const {
		if (capacity == Ln::Amount::msat(0))
			return 0;
		return local / capacity;
	}
	bool consistent() const {
		return local + remote <= capacity;
	}
};

}

#endif /* !defined(REBAL_CHANNEL_HPP) */
