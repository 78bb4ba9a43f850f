#ifndef REBAL_MSG_ATTEMPTRESOLVED_HPP
#define REBAL_MSG_ATTEMPTRESOLVED_HPP

#include"Rebal/RebalanceAttempt.hpp"

namespace Rebal { namespace Msg {

/** struct Rebal::Msg::AttemptResolved
 *
 * @brief an attempt has reached a terminal status,
 * or was left ambiguous after reconciliation.
 * Raised again when an ambiguous attempt is
 * finally resolved.
 */
struct AttemptResolved {
	RebalanceAttempt attempt;
};

}}

#endif /* !defined(REBAL_MSG_ATTEMPTRESOLVED_HPP) */
