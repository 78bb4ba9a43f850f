#ifndef REBAL_MOD_CHANNELMONITOR_HPP
#define REBAL_MOD_CHANNELMONITOR_HPP

#include"Rebal/Channel.hpp"
#include<vector>

namespace Ev { template<typename a> class Io; }
namespace Rebal { class NodeIF; }
namespace Rebal { struct Config; }
namespace Rebal { namespace Mod { class AttemptHistory; }}
namespace Rebal { namespace Mod { class Waiter; }}
namespace S { class Bus; }

namespace Rebal { namespace Mod {

/** class Rebal::Mod::ChannelMonitor
 *
 * @brief fetches our channels from the node and
 * annotates them with their last successful
 * rebalance.
 *
 * @desc Channels whose balances exceed their
 * capacity are dropped with an error log.
 * Throws ConnectivityError or NodeError if the
 * node cannot give us the list.
 */
class ChannelMonitor {
private:
	S::Bus& bus;
	Mod::Waiter& waiter;
	Rebal::Config const& config;
	Rebal::NodeIF& node;
	Mod::AttemptHistory& history;

public:
	ChannelMonitor() =delete;
	ChannelMonitor(ChannelMonitor const&) =delete;

	ChannelMonitor( S::Bus& bus_
		      , Mod::Waiter& waiter_
		      , Rebal::Config const& config_
		      , Rebal::NodeIF& node_
		      , Mod::AttemptHistory& history_
		      ) : bus(bus_)
			, waiter(waiter_)
			, config(config_)
			, node(node_)
			, history(history_)
			{ }

	Ev::Io<std::vector<Rebal::Channel>> refresh();
};

}}

#endif /* !defined(REBAL_MOD_CHANNELMONITOR_HPP) */
