#include"Ev/Io.hpp"
#include"Rebal/Config.hpp"
#include"Rebal/Mod/RoutePlanner.hpp"
#include"Rebal/bounded.hpp"
#include"Rebal/log.hpp"
#include"Util/stringify.hpp"

namespace Rebal { namespace Mod {

Ev::Io<Rebal::Plan> RoutePlanner::plan(Rebal::Candidate const& candidate) {
	auto hints = RouteHints{candidate.source.id, candidate.destination.id};
	return bounded( waiter, config.call_timeout
		      , node.find_route(hints, candidate.amount)
		      ).catching<NodeError>([hints](NodeError const& e) -> Ev::Io<Rebal::Route> {
		/* An answer we cannot use for this pair, such
		 * as a missing channel update for an
		 * unannounced channel, is no route for it.  */
		throw NoRouteError( "Node could not route "
				  + std::string(hints.source) + " -> "
				  + std::string(hints.destination) + ": "
				  + e.what()
				  );
	}).then([this, candidate, hints](Rebal::Route route) {
		if ( route.channels.size() < 2
		  || route.channels.front() != hints.source
		  || route.channels.back() != hints.destination
		   )
			throw NoRouteError(
				"Node offered a route not through "
			      + std::string(hints.source) + " and "
			      + std::string(hints.destination)
			);
		auto ret = Plan{candidate, hints, std::move(route)};
		return Rebal::log( bus, Debug
				 , "RoutePlanner: "
				   "%s -> %s: %zu hops, fee estimate %s "
				   "for %s."
				 , std::string(hints.source).c_str()
				 , std::string(hints.destination).c_str()
				 , ret.route.channels.size()
				 , Util::stringify(ret.route.fee).c_str()
				 , Util::stringify(candidate.amount).c_str()
				 ).then([ret]() {
			return Ev::lift(ret);
		});
	});
}

}}
