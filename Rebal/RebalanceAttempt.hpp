#ifndef REBAL_REBALANCEATTEMPT_HPP
#define REBAL_REBALANCEATTEMPT_HPP

#include"Ln/Amount.hpp"
#include"Ln/Scid.hpp"
#include<string>

namespace Rebal {

enum AttemptStatus {
	Pending,
	InFlight,
	Succeeded,
	Failed,
	Ambiguous
};

char const* status_string(AttemptStatus);
/* Throws std::invalid_argument on unknown strings.  */
AttemptStatus status_from_string(std::string const&);

/** struct Rebal::RebalanceAttempt
 *
 * @brief one self-payment moving `amount` out
 * through `source` and back in through
 * `destination`.
 */
struct RebalanceAttempt {
	Ln::Scid source;
	Ln::Scid destination;
	Ln::Amount amount;
	Ln::Amount fee_ceiling;
	AttemptStatus status;
	double created;
	/* 0 while not terminal.  */
	double resolved;
	std::string reason;
	/* Identifier the node uses to track the payment.
	 * Empty if the payment was never submitted.  */
	std::string attempt_id;
	std::string payment_hash;
	/* Only meaningful if fee_known.  */
	Ln::Amount fee;
	bool fee_known;

	bool terminal() const {
		return status == Succeeded || status == Failed;
	}
};

}

#endif /* !defined(REBAL_REBALANCEATTEMPT_HPP) */
