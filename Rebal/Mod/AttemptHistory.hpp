#ifndef REBAL_MOD_ATTEMPTHISTORY_HPP
#define REBAL_MOD_ATTEMPTHISTORY_HPP

#include"Ln/Scid.hpp"
#include<cstddef>
#include<map>
#include<memory>
#include<vector>

namespace Ev { template<typename a> class Io; }
namespace Rebal { struct RebalanceAttempt; }
namespace S { class Bus; }

namespace Rebal { namespace Mod {

/** class Rebal::Mod::AttemptHistory
 *
 * @brief records every attempt announced by
 * `Msg::AttemptResolved` in the database.
 *
 * @desc An attempt announced again with the same
 * node attempt id (an ambiguous attempt that got
 * resolved later) updates its earlier record.
 */
class AttemptHistory {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	AttemptHistory() =delete;
	AttemptHistory(AttemptHistory&&);
	~AttemptHistory();

	explicit
	AttemptHistory(S::Bus& bus);

	Ev::Io<void> record(Rebal::RebalanceAttempt const& attempt);

	/* Attempts still marked ambiguous, oldest first.  */
	Ev::Io<std::vector<Rebal::RebalanceAttempt>> unresolved();

	/* Time of the latest success touching each
	 * channel.  */
	Ev::Io<std::map<Ln::Scid, double>> last_successes();

	/* Deletes succeeded and failed attempts resolved
	 * before the given time, returning how many were
	 * deleted.  Ambiguous attempts are kept.  */
	Ev::Io<std::size_t> prune(double before);

	/* Newest first.  */
	Ev::Io<std::vector<Rebal::RebalanceAttempt>>
	recent(std::size_t limit);
};

}}

#endif /* !defined(REBAL_MOD_ATTEMPTHISTORY_HPP) */
