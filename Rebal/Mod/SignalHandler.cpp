#include"Ev/Io.hpp"
#include"Rebal/Mod/SignalHandler.hpp"
#include"Rebal/Msg/Begin.hpp"
#include"Rebal/Msg/ShutdownRequest.hpp"
#include"Rebal/Shutdown.hpp"
#include"Rebal/concurrent.hpp"
#include"S/Bus.hpp"
#include"Util/make_unique.hpp"
#include<ev.h>
#include<iostream>
#include<signal.h>

namespace Rebal { namespace Mod {

class SignalHandler::Impl {
private:
	S::Bus& bus;

	ev_signal sigint;
	ev_signal sigterm;
	bool started;

	static
	void signal_handler(EV_P_ ev_signal* w, int revents) {
		auto self = (Impl*) w->data;
		auto signum = w->signum;
		auto act = Rebal::concurrent(self->bus.raise(
			Msg::ShutdownRequest{signum}
		));
		act.run([]() { }, [](std::exception_ptr e) {
			try {
				std::rethrow_exception(e);
			} catch (std::exception const& ex) {
				std::cerr << "rebalancer: shutdown request failed: "
					  << ex.what() << std::endl;
			} catch (...) {
				std::cerr << "rebalancer: shutdown request failed "
					     "with exception of unknown type"
					  << std::endl;
			}
		});
	}

	void start_watcher(ev_signal& w, int signum) {
		ev_signal_init(&w, &signal_handler, signum);
		w.data = this;
		ev_signal_start(EV_DEFAULT_ &w);
		/* Do not count as an active watcher.  */
		ev_unref(EV_DEFAULT);
	}
	void stop_watcher(ev_signal& w) {
		ev_ref(EV_DEFAULT);
		ev_signal_stop(EV_DEFAULT_ &w);
	}

	void stop() {
		if (!started)
			return;
		started = false;
		stop_watcher(sigint);
		stop_watcher(sigterm);
	}

public:
	explicit
	Impl(S::Bus& bus_) : bus(bus_), started(false) {
		bus.subscribe<Msg::Begin>([this](Msg::Begin const&) {
			if (!started) {
				start_watcher(sigint, SIGINT);
				start_watcher(sigterm, SIGTERM);
				started = true;
			}
			return Ev::lift();
		});
		bus.subscribe<Rebal::Shutdown>([this](Rebal::Shutdown const&) {
			stop();
			return Ev::lift();
		});
	}
	~Impl() {
		stop();
	}
};

SignalHandler::SignalHandler(S::Bus& bus)
	: pimpl(Util::make_unique<Impl>(bus)) { }
SignalHandler::~SignalHandler() =default;

}}
