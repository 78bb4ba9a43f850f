#ifndef REBAL_MOD_ROUTEPLANNER_HPP
#define REBAL_MOD_ROUTEPLANNER_HPP

#include"Rebal/CandidateSelector.hpp"
#include"Rebal/NodeIF.hpp"

namespace Ev { template<typename a> class Io; }
namespace Rebal { struct Config; }
namespace Rebal { namespace Mod { class Waiter; }}
namespace S { class Bus; }

namespace Rebal {

/* What the executor needs to attempt a candidate.  */
struct Plan {
	Rebal::Candidate candidate;
	Rebal::RouteHints hints;
	Rebal::Route route;
};

}

namespace Rebal { namespace Mod {

/** class Rebal::Mod::RoutePlanner
 *
 * @brief asks the node for a route that leaves
 * through the source channel and comes back
 * through the destination channel.
 *
 * @desc Throws NoRouteError if the node has no
 * such route, answers the route query with an
 * error, or offers a route that does not start
 * and end at the hinted channels.
 * ConnectivityError is left to the caller.
 */
class RoutePlanner {
private:
	S::Bus& bus;
	Mod::Waiter& waiter;
	Rebal::Config const& config;
	Rebal::NodeIF& node;

public:
	RoutePlanner() =delete;
	RoutePlanner(RoutePlanner const&) =delete;

	RoutePlanner( S::Bus& bus_
		    , Mod::Waiter& waiter_
		    , Rebal::Config const& config_
		    , Rebal::NodeIF& node_
		    ) : bus(bus_)
		      , waiter(waiter_)
		      , config(config_)
		      , node(node_)
		      { }

	Ev::Io<Rebal::Plan> plan(Rebal::Candidate const& candidate);
};

}}

#endif /* !defined(REBAL_MOD_ROUTEPLANNER_HPP) */
