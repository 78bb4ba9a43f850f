#include"Rebal/CandidateSelector.hpp"
#include"Rebal/Config.hpp"
#include"Rebal/plan_amount.hpp"
#include<algorithm>

namespace {

bool peer_allowed(Ln::NodeId const& peer, Rebal::Config const& config) {
	if (config.exclude_peers.count(peer) != 0)
		return false;
	if (!config.include_peers.empty()
	 && config.include_peers.count(peer) == 0)
		return false;
	return true;
}

bool usable(Rebal::Channel const& c, Rebal::Config const& config) {
	return c.active
	    && c.capacity != Ln::Amount::msat(0)
	    && peer_allowed(c.peer, config)
	     ;
}

}

namespace Rebal {

std::vector<Candidate>
select_candidates( std::vector<Rebal::Channel> const& channels
		 , Rebal::Config const& config
		 , std::function<bool( Ln::Scid const& source
				     , Ln::Scid const& destination
				     )> const& excluded
		 ) {
	auto sources = std::vector<Channel const*>();
	auto destinations = std::vector<Channel const*>();
	for (auto const& c : channels) {
		if (!usable(c, config))
			continue;
		auto ratio = c.local_ratio();
		if (ratio > config.ratio_high)
			sources.push_back(&c);
		else if (ratio < config.ratio_low)
			destinations.push_back(&c);
	}

	auto ret = std::vector<Candidate>();
	for (auto s : sources) {
		for (auto d : destinations) {
			if (s->id == d->id)
				continue;
			if (!config.allow_same_peer && s->peer == d->peer)
				continue;
			if (excluded(s->id, d->id))
				continue;
			auto amount = plan_amount(*s, *d, config);
			if (amount == Ln::Amount::msat(0))
				continue;
			auto deficiency = (s->local - s->capacity * config.ratio_high)
					+ (d->capacity * config.ratio_low - d->local)
					;
			ret.push_back(Candidate{*s, *d, amount, deficiency});
		}
	}

	std::sort( ret.begin(), ret.end()
		 , [](Candidate const& a, Candidate const& b) {
		if (a.deficiency != b.deficiency)
			return a.deficiency > b.deficiency;
		if (a.source.id != b.source.id)
			return a.source.id < b.source.id;
		return a.destination.id < b.destination.id;
	});

	return ret;
}

}
