#include"Ev/Io.hpp"
#include"Ev/yield.hpp"
#include"Rebal/Mod/Waiter.hpp"
#include"Rebal/Shutdown.hpp"
#include"S/Bus.hpp"
#include"Util/make_unique.hpp"
#include<ev.h>
#include<list>

namespace Rebal { namespace Mod {

class Waiter::Impl {
private:
	bool is_shutting_down;

	/* Information structure for each timer.  */
	struct Info {
		Impl *pimpl;
		std::function<void()> pass;
		std::function<void(std::exception_ptr)> fail;
		std::list<ev_timer>::iterator it;
	};
	std::list<ev_timer> timers;
	typedef std::list<ev_timer>::iterator TimerIt;

	/* Fails every pending timer with Rebal::Shutdown.  */
	void shutdown() {
		is_shutting_down = true;
		/* Move the timers out of the current object, since
		 * resuming a greenthread may start new timers.  */
		auto timers_copy = std::move(timers);
		timers.clear();

		for (auto& timer : timers_copy) {
			/* Reacquire control of the info structure.  */
			auto info = std::unique_ptr<Info>((Info*) timer.data);
			auto fail = std::move(info->fail);
			ev_timer_stop(EV_DEFAULT_ &timer);

			fail_shutdown(fail);
		}
	}

	void fail_shutdown(std::function<void(std::exception_ptr)> fail) {
		try {
			throw Rebal::Shutdown();
		} catch (...) {
			fail(std::current_exception());
		}
	}

	static
	void timer_static_handler(EV_P_ ev_timer *timer, int revents) {
		/* Reacquire control of the info structure.  */
		auto info = std::unique_ptr<Info>((Info*)timer->data);
		auto pass = std::move(info->pass);
		ev_timer_stop(EV_A_ timer);
		info->pimpl->timers.erase(info->it);

		pass();
	}

	/* Starts a timer that calls pass after the given
	 * number of seconds.  */
	TimerIt start_timer( double seconds
			   , std::function<void()> pass
			   , std::function<void(std::exception_ptr)> fail
			   ) {
		auto it = timers.emplace(timers.begin(), ev_timer());
		ev_timer_init(&*it, &timer_static_handler, seconds, 0);
		auto info = Util::make_unique<Info>();
		info->pimpl = this;
		info->pass = std::move(pass);
		info->fail = std::move(fail);
		info->it = it;
		/* Release the info to the ev_timer.  */
		it->data = info.release();
		ev_timer_start(EV_DEFAULT_ &*it);
		return it;
	}
	/* Stops a timer without resuming anyone.  */
	void cancel_timer(TimerIt it) {
		auto info = std::unique_ptr<Info>((Info*) it->data);
		ev_timer_stop(EV_DEFAULT_ &*it);
		timers.erase(it);
	}

public:
	explicit
	Impl(S::Bus& bus) {
		is_shutting_down = false;
		bus.subscribe<Rebal::Shutdown>([this](Rebal::Shutdown const&) {
			shutdown();
			return Ev::lift();
		});
	}

	Ev::Io<void> wait(double seconds) {
		return Ev::Io<void>([ this
				    , seconds
				    ]( std::function<void()> pass
				     , std::function<void(std::exception_ptr)> fail
				     ) {
			if (is_shutting_down)
				return fail_shutdown(fail);
			(void) start_timer(seconds, std::move(pass), std::move(fail));
		});
	}

	struct TimedCoreData {
		std::function<void()> pass;
		std::function<void(std::exception_ptr)> fail;
		/* Set once resumed.  */
		bool flag;
		/* Valid while the timer is pending.  */
		bool has_timer;
		TimerIt timer;
	};

	Ev::Io<void> timed_core(double timeout, Ev::Io<void> action) {
		auto paction = std::make_shared<Ev::Io<void>>(
			std::move(action)
		);
		return Ev::Io<void>([ this
				    , timeout
				    , paction
				    ]( std::function<void()> pass
				     , std::function<void(std::exception_ptr)> fail
				     ) {
			if (is_shutting_down)
				return fail_shutdown(fail);

			auto sh = std::make_shared<TimedCoreData>();
			sh->pass = std::move(pass);
			sh->fail = std::move(fail);
			sh->flag = false;
			sh->has_timer = false;

			/* Whichever of the action or the timer finishes
			 * first resumes us.
			 * If the action finishes first the timer is
			 * cancelled, so it does not keep the main loop
			 * alive.  */
			auto finish = [this, sh]() {
				sh->flag = true;
				if (sh->has_timer) {
					sh->has_timer = false;
					cancel_timer(sh->timer);
				}
			};
			auto sub_pass = [sh, finish]() {
				if (sh->flag)
					return;
				finish();
				auto pass = std::move(sh->pass);
				sh->fail = nullptr;
				pass();
			};
			auto sub_fail = [sh, finish](std::exception_ptr e) {
				if (sh->flag)
					return;
				finish();
				auto fail = std::move(sh->fail);
				sh->pass = nullptr;
				fail(e);
			};
			auto on_timeout = [sh, timeout]() {
				if (sh->flag)
					return;
				/* The timer has already removed itself.  */
				sh->has_timer = false;
				sh->flag = true;
				auto fail = std::move(sh->fail);
				sh->pass = nullptr;
				try {
					throw TimedOut(timeout);
				} catch (...) {
					fail(std::current_exception());
				}
			};
			auto on_shutdown = [sh](std::exception_ptr e) {
				if (sh->flag)
					return;
				sh->has_timer = false;
				sh->flag = true;
				auto fail = std::move(sh->fail);
				sh->pass = nullptr;
				fail(e);
			};
			sh->timer = start_timer(timeout, on_timeout, on_shutdown);
			sh->has_timer = true;

			paction->run(sub_pass, sub_fail);
		}).then([]() {
			return Ev::yield();
		});
	}
};

Waiter::Waiter(S::Bus& bus) : pimpl(Util::make_unique<Impl>(bus)) {}
Waiter::~Waiter() { }

Ev::Io<void> Waiter::wait(double seconds) {
	return pimpl->wait(seconds);
}
Ev::Io<void> Waiter::timed_core(double timeout, Ev::Io<void> action) {
	return pimpl->timed_core(timeout, std::move(action));
}

}}
