#include"Ev/Io.hpp"
#include"Ev/now.hpp"
#include"Rebal/Mod/Logger.hpp"
#include"Rebal/Msg/Log.hpp"
#include"S/Bus.hpp"
#include"Util/date.hpp"
#include<cctype>
#include<string>

namespace Rebal { namespace Mod {

Logger::Logger( std::ostream& os_
	      , S::Bus& bus
	      , LogLevel min_level_
	      ) : os(os_), min_level(min_level_) {
	bus.subscribe<Msg::Log>([this](Msg::Log const& l) {
		if (l.level < min_level)
			return Ev::lift();
		auto level = std::string(log_level_string(l.level));
		for (auto& c : level)
			c = std::toupper(c);
		os << Util::date(Ev::now()) << " "
		   << level << " "
		   << l.message
		   << std::endl
		   ;
		return Ev::lift();
	});
}

}}
