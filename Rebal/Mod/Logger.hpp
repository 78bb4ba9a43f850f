#ifndef REBAL_MOD_LOGGER_HPP
#define REBAL_MOD_LOGGER_HPP

#include"Rebal/log.hpp"
#include<ostream>

namespace S { class Bus; }

namespace Rebal { namespace Mod {

/** class Rebal::Mod::Logger
 *
 * @brief writes `Rebal::Msg::Log` messages at or
 * above the given level to the given stream, one
 * line each, prefixed with the UTC time and the
 * level.
 */
class Logger {
private:
	std::ostream& os;
	LogLevel min_level;

public:
	Logger() =delete;
	Logger(Logger const&) =delete;
	Logger(Logger&&) =delete;

	Logger( std::ostream& os
	      , S::Bus& bus
	      , LogLevel min_level
	      );
};

}}

#endif /* !defined(REBAL_MOD_LOGGER_HPP) */
