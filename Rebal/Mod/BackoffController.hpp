#ifndef REBAL_MOD_BACKOFFCONTROLLER_HPP
#define REBAL_MOD_BACKOFFCONTROLLER_HPP

#include<cstddef>
#include<memory>
#include<string>

namespace Ev { template<typename a> class Io; }
namespace Ln { class Scid; }
namespace Rebal { struct Config; }
namespace S { class Bus; }

namespace Rebal { namespace Mod {

/** class Rebal::Mod::BackoffController
 *
 * @brief tracks consecutive failures of each
 * (source, destination) channel pair and keeps
 * failing pairs out of selection for a while.
 *
 * @desc A failure (including finding no route)
 * excludes the pair for `cooldown(failures)`
 * seconds.
 * Once failures reach `failure-cap` the pair is
 * excluded permanently, or for `cap-cooldown` if
 * `permanent-exclusion` is off.
 * A success clears the count and excludes the
 * pair only for `success-cooldown`.
 * An attempt with an unknown outcome excludes the
 * pair until it is resolved or manually reset.
 *
 * Exclusions are persisted once `Msg::DbResource`
 * is raised.
 */
class BackoffController {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	BackoffController() =delete;
	BackoffController(BackoffController&&);
	~BackoffController();

	BackoffController( S::Bus& bus
			 , Rebal::Config const& config
			 );

	bool is_excluded( Ln::Scid const& source
			, Ln::Scid const& destination
			, double now
			) const;

	/* Idle <-> Attempting.
	 * Release is for attempts that end without any
	 * outcome (no budget, nothing to move).  */
	void mark_attempting( Ln::Scid const& source
			    , Ln::Scid const& destination
			    );
	void release_attempt( Ln::Scid const& source
			    , Ln::Scid const& destination
			    );

	Ev::Io<void> record_success( Ln::Scid const& source
				   , Ln::Scid const& destination
				   , double now
				   );
	Ev::Io<void> record_failure( Ln::Scid const& source
				   , Ln::Scid const& destination
				   , std::string const& reason
				   , double now
				   );
	Ev::Io<void> record_ambiguous( Ln::Scid const& source
				     , Ln::Scid const& destination
				     , double now
				     );

	/* Clears exclusions that reached the failure
	 * cap or wait on an ambiguous attempt, returning
	 * how many were cleared.  */
	Ev::Io<std::size_t> reset_permanent();

	/* Inspection.  */
	std::size_t failures( Ln::Scid const& source
			    , Ln::Scid const& destination
			    ) const;
	bool is_permanent( Ln::Scid const& source
			 , Ln::Scid const& destination
			 ) const;
	bool is_attempting( Ln::Scid const& source
			  , Ln::Scid const& destination
			  ) const;

	/* Cool-down after the n-th consecutive failure:
	 * min(base * 2^n, max).  */
	static
	double cooldown(std::size_t n, double base, double max);
};

}}

#endif /* !defined(REBAL_MOD_BACKOFFCONTROLLER_HPP) */
