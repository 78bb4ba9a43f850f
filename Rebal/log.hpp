#ifndef REBAL_LOG_HPP
#define REBAL_LOG_HPP

namespace Ev { template<typename a> class Io; }
namespace S { class Bus; }

namespace Rebal {

enum LogLevel {
	Trace,
	Debug,
	Info,
	Warn,
	Error
};

char const* log_level_string(LogLevel);

/** Rebal::log
 *
 * @brief formats the message printf-style and
 * broadcasts it as a `Rebal::Msg::Log`.
 */
Ev::Io<void> log(S::Bus& bus, LogLevel l, const char *fmt, ...)
	__attribute__ ((format (printf, 3, 4)))
;

}

#endif /* REBAL_LOG_HPP */
