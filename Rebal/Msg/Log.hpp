#ifndef REBAL_MSG_LOG_HPP
#define REBAL_MSG_LOG_HPP

#include"Rebal/log.hpp"
#include<string>

namespace Rebal { namespace Msg {

/** struct Rebal::Msg::Log
 *
 * @brief a formatted log message.
 * Raised by `Rebal::log`; written out by
 * `Rebal::Mod::Logger`.
 */
struct Log {
	LogLevel level;
	std::string message;
};

}}

#endif /* !defined(REBAL_MSG_LOG_HPP) */
