#undef NDEBUG
#include"Rebal/CandidateSelector.hpp"
#include"Rebal/Config.hpp"
#include<assert.h>
#include<set>
#include<utility>

namespace {

auto const A = Ln::NodeId("020000000000000000000000000000000000000000000000000000000000000001");
auto const B = Ln::NodeId("020000000000000000000000000000000000000000000000000000000000000002");
auto const C = Ln::NodeId("020000000000000000000000000000000000000000000000000000000000000003");
auto const D = Ln::NodeId("020000000000000000000000000000000000000000000000000000000000000004");

Rebal::Channel channel( char const* scid
		      , Ln::NodeId const& peer
		      , std::uint64_t local_sat
		      , bool active = true
		      ) {
	auto ret = Rebal::Channel();
	ret.id = Ln::Scid(scid);
	ret.peer = peer;
	ret.capacity = Ln::Amount::sat(1000000);
	ret.local = Ln::Amount::sat(local_sat);
	ret.remote = ret.capacity - ret.local;
	ret.active = active;
	ret.last_success = 0;
	return ret;
}

bool none(Ln::Scid const&, Ln::Scid const&) {
	return false;
}

}

int main() {
	auto config = Rebal::Config();

	auto channels = std::vector<Rebal::Channel>{
		/* Sources.  */
		channel("1x1x1", A, 900000),
		channel("2x2x2", B, 700000),
		/* Within band.  */
		channel("3x3x3", C, 500000),
		/* Destinations.  */
		channel("4x4x4", D, 100000),
		channel("5x5x5", A, 300000),
		/* Inactive.  */
		channel("6x6x6", C, 0, false)
	};

	{
		auto cs = Rebal::select_candidates(channels, config, &none);
		/* 1->4, 1->5 (same peer A, dropped), 2->4, 2->5.  */
		assert(cs.size() == 3);
		/* Deficiency 300k + 300k.  */
		assert(cs[0].source.id == Ln::Scid("1x1x1"));
		assert(cs[0].destination.id == Ln::Scid("4x4x4"));
		assert(cs[0].deficiency == Ln::Amount::sat(600000));
		assert(cs[0].amount == Ln::Amount::sat(300000));
		/* Deficiency 100k + 300k.  */
		assert(cs[1].source.id == Ln::Scid("2x2x2"));
		assert(cs[1].destination.id == Ln::Scid("4x4x4"));
		assert(cs[1].amount == Ln::Amount::sat(100000));
		/* Deficiency 100k + 100k.  */
		assert(cs[2].source.id == Ln::Scid("2x2x2"));
		assert(cs[2].destination.id == Ln::Scid("5x5x5"));
	}

	/* Same-peer pairs when allowed.  */
	{
		config.allow_same_peer = true;
		auto cs = Rebal::select_candidates(channels, config, &none);
		assert(cs.size() == 4);
		config.allow_same_peer = false;
	}

	/* Excluded pairs.  */
	{
		auto excluded = std::set<std::pair<Ln::Scid, Ln::Scid>>{
			{Ln::Scid("1x1x1"), Ln::Scid("4x4x4")}
		};
		auto cs = Rebal::select_candidates(channels, config
						  , [&]( Ln::Scid const& s
						       , Ln::Scid const& d
						       ) {
			return excluded.count(std::make_pair(s, d)) != 0;
		});
		assert(cs.size() == 2);
		assert(cs[0].source.id == Ln::Scid("2x2x2"));
	}

	/* Peer lists.  */
	{
		config.exclude_peers.insert(D);
		auto cs = Rebal::select_candidates(channels, config, &none);
		assert(cs.size() == 1);
		assert(cs[0].destination.id == Ln::Scid("5x5x5"));
		config.exclude_peers.clear();

		config.include_peers.insert(A);
		config.include_peers.insert(D);
		cs = Rebal::select_candidates(channels, config, &none);
		assert(cs.size() == 1);
		assert(cs[0].source.id == Ln::Scid("1x1x1"));
		assert(cs[0].destination.id == Ln::Scid("4x4x4"));
		config.include_peers.clear();
	}

	/* Same input, same output.  */
	{
		auto reversed = std::vector<Rebal::Channel>( channels.rbegin()
							   , channels.rend()
							   );
		auto cs1 = Rebal::select_candidates(channels, config, &none);
		auto cs2 = Rebal::select_candidates(reversed, config, &none);
		assert(cs1.size() == cs2.size());
		for (auto i = std::size_t(0); i < cs1.size(); ++i) {
			assert(cs1[i].source.id == cs2[i].source.id);
			assert(cs1[i].destination.id == cs2[i].destination.id);
		}
	}

	/* Nothing to do when everything is balanced.  */
	{
		auto balanced = std::vector<Rebal::Channel>{
			channel("1x1x1", A, 500000),
			channel("2x2x2", B, 450000)
		};
		assert(Rebal::select_candidates(balanced, config, &none).empty());
	}

	return 0;
}
