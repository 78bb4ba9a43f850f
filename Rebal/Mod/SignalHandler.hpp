#ifndef REBAL_MOD_SIGNALHANDLER_HPP
#define REBAL_MOD_SIGNALHANDLER_HPP

#include<memory>

namespace S { class Bus; }

namespace Rebal { namespace Mod {

/** class Rebal::Mod::SignalHandler
 *
 * @brief turns SIGINT and SIGTERM into
 * `Msg::ShutdownRequest` on the bus.
 *
 * @desc The signal watchers are installed at
 * `Msg::Begin` and removed at `Rebal::Shutdown`.
 * They do not by themselves keep the main loop
 * running.
 */
class SignalHandler {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	SignalHandler() =delete;
	SignalHandler(SignalHandler const&) =delete;
	~SignalHandler();

	explicit
	SignalHandler(S::Bus& bus);
};

}}

#endif /* !defined(REBAL_MOD_SIGNALHANDLER_HPP) */
