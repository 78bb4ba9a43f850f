#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include"Rebal/Mod/Waiter.hpp"
#include"Rebal/NodeIF.hpp"
#include"Rebal/Shutdown.hpp"
#include"Rebal/bounded.hpp"
#include"S/Bus.hpp"
#include<assert.h>
#include<memory>

int main() {
	S::Bus bus;
	Rebal::Mod::Waiter waiter(bus);

	/* Many quick actions in a row must not leave
	 * timers behind.  */
	auto loop_test = [&]() {
		auto counter = std::make_shared<std::size_t>(500);
		auto ploop = std::make_shared<std::function<Ev::Io<void>()>
					     >();
		*ploop = [&waiter, counter, ploop]() {
			if ((*counter) == 0) {
				*ploop = nullptr;
				return Ev::lift();
			}
			--(*counter);

			return Ev::lift().then([&waiter]() {
				auto action = Ev::yield().then([]() {
					return Ev::lift(true);
				});
				return waiter.timed(60, action
						   ).catching<Rebal::Mod::Waiter::TimedOut>([](Rebal::Mod::Waiter::TimedOut const&) {
					return Ev::lift(false);
				});
			}).then([ploop](bool flag) {
				assert(flag);
				return (*ploop)();
			});
		};

		return (*ploop)();
	};

	auto code = Ev::lift().then([&]() {
		return waiter.timed(60, Ev::lift(42));
	}).then([&](int i) {
		assert(i == 42);

		/* Action delays, but completes first.  */
		return waiter.timed(60, waiter.wait(0.001));
	}).then([&]() {

		/* Timeout reached first.  */
		return waiter.timed(0.001, Ev::lift().then([&]() {
			return waiter.wait(60);
		}).then([]() {
			return Ev::lift(true);
		})).catching<Rebal::Mod::Waiter::TimedOut>([](Rebal::Mod::Waiter::TimedOut const&) {
			return Ev::lift(false);
		});
	}).then([&](bool flag) {
		assert(!flag);

		/* A node call that takes too long is a
		 * connectivity problem.  */
		auto call = waiter.wait(60).then([]() {
			return Ev::lift(std::string("late"));
		});
		return Rebal::bounded(waiter, 0.001, call
				     ).then([](std::string) {
			return Ev::lift(false);
		}).catching<Rebal::ConnectivityError
			   >([](Rebal::ConnectivityError const&) {
			return Ev::lift(true);
		});
	}).then([&](bool flag) {
		assert(flag);

		/* Errors of the call pass through untouched.  */
		auto call = Ev::lift().then([]() -> Ev::Io<int> {
			throw Rebal::NodeError("bad");
		});
		return Rebal::bounded(waiter, 60, call).then([](int) {
			return Ev::lift(false);
		}).catching<Rebal::NodeError>([](Rebal::NodeError const&) {
			return Ev::lift(true);
		});
	}).then([&](bool flag) {
		assert(flag);

		return loop_test();
	}).then([&]() {

		/* Cancel all pending waiters.  */
		return bus.raise(Rebal::Shutdown());
	}).then([&]() {
		/* Waits after shutdown fail immediately.  */
		return waiter.wait(60).then([]() {
			return Ev::lift(false);
		}).catching<Rebal::Shutdown>([](Rebal::Shutdown const&) {
			return Ev::lift(true);
		});
	}).then([](bool flag) {
		assert(flag);
		return Ev::lift(0);
	});

	return Ev::start(code);
}
