#undef NDEBUG
#include"Rebal/Channel.hpp"
#include"Rebal/Config.hpp"
#include"Rebal/plan_amount.hpp"
#include<assert.h>

namespace {

Rebal::Channel channel(char const* scid, std::uint64_t local_sat) {
	auto ret = Rebal::Channel();
	ret.id = Ln::Scid(scid);
	ret.peer = Ln::NodeId("020000000000000000000000000000000000000000000000000000000000000001");
	ret.capacity = Ln::Amount::sat(1000000);
	ret.local = Ln::Amount::sat(local_sat);
	ret.remote = ret.capacity - ret.local;
	ret.active = true;
	ret.last_success = 0;
	return ret;
}

}

int main() {
	auto config = Rebal::Config();

	/* Source surplus above 0.6 is 300k, destination
	 * room above 0.4 is 500k.  */
	auto src = channel("1x1x1", 900000);
	auto dst = channel("2x2x2", 100000);
	assert(Rebal::plan_amount(src, dst, config) == Ln::Amount::sat(300000));

	/* Destination is the tighter side.  */
	src = channel("1x1x1", 1000000);
	dst = channel("2x2x2", 500000);
	assert(Rebal::plan_amount(src, dst, config) == Ln::Amount::sat(100000));

	/* Capped by max-amount.  */
	config.max_amount = Ln::Amount::sat(50000);
	assert(Rebal::plan_amount(src, dst, config) == Ln::Amount::sat(50000));
	config.max_amount = Ln::Amount::sat(1000000);

	/* Reserve margin comes off both sides.  */
	config.reserve_margin = Ln::Amount::sat(20000);
	src = channel("1x1x1", 900000);
	dst = channel("2x2x2", 100000);
	assert(Rebal::plan_amount(src, dst, config) == Ln::Amount::sat(280000));
	config.reserve_margin = Ln::Amount::sat(0);

	/* Below min-amount is not viable.  */
	src = channel("1x1x1", 605000);
	assert(Rebal::plan_amount(src, dst, config) == Ln::Amount::msat(0));

	/* Reserve eating everything is not viable either.  */
	config.reserve_margin = Ln::Amount::sat(400000);
	src = channel("1x1x1", 900000);
	assert(Rebal::plan_amount(src, dst, config) == Ln::Amount::msat(0));

	return 0;
}
