#include"Rebal/Channel.hpp"
#include"Rebal/Config.hpp"
#include"Rebal/plan_amount.hpp"

namespace Rebal {

Ln::Amount plan_amount( Rebal::Channel const& source
		      , Rebal::Channel const& destination
		      , Rebal::Config const& config
		      ) {
	/* Ln::Amount subtraction saturates at zero.  */
	auto surplus = source.local
		     - source.capacity * config.ratio_high
		     - config.reserve_margin
		     ;
	auto room = destination.remote
		  - destination.capacity * config.ratio_low
		  - config.reserve_margin
		  ;

	auto amount = config.max_amount;
	if (surplus < amount)
		amount = surplus;
	if (room < amount)
		amount = room;

	if (amount < config.min_amount)
		return Ln::Amount::msat(0);
	return amount;
}

}
