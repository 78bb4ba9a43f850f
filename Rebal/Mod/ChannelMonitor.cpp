#include"Ev/Io.hpp"
#include"Rebal/Config.hpp"
#include"Rebal/Mod/AttemptHistory.hpp"
#include"Rebal/Mod/ChannelMonitor.hpp"
#include"Rebal/bounded.hpp"
#include"Rebal/log.hpp"
#include"Util/stringify.hpp"
#include<map>
#include<memory>

namespace Rebal { namespace Mod {

Ev::Io<std::vector<Rebal::Channel>> ChannelMonitor::refresh() {
	typedef std::vector<Rebal::Channel> Channels;
	return bounded( waiter, config.call_timeout
		      , node.list_channels()
		      ).then([this](Channels raw) {
		auto praw = std::make_shared<Channels>(std::move(raw));
		return history.last_successes().then([ this
						     , praw
						     ](std::map<Ln::Scid, double> last) {
			auto ret = Channels();
			auto act = Ev::lift();
			for (auto& c : *praw) {
				if (!c.consistent()) {
					act = act + Rebal::log( bus, Error
							      , "ChannelMonitor: "
								"Dropping %s: "
								"local %s + remote %s "
								"exceeds capacity %s."
							      , std::string(c.id).c_str()
							      , Util::stringify(c.local).c_str()
							      , Util::stringify(c.remote).c_str()
							      , Util::stringify(c.capacity).c_str()
							      );
					continue;
				}
				auto it = last.find(c.id);
				c.last_success = (it == last.end()) ? 0 : it->second;
				ret.push_back(std::move(c));
			}
			auto count = ret.size();
			auto pret = std::make_shared<Channels>(std::move(ret));
			return ( act
			       + Rebal::log( bus, Debug
					   , "ChannelMonitor: "
					     "%zu channels."
					   , count
					   )
			       ).then([pret]() {
				return Ev::lift(std::move(*pret));
			});
		});
	});
}

}}
