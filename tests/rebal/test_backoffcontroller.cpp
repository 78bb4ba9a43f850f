#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Rebal/CandidateSelector.hpp"
#include"Rebal/Config.hpp"
#include"Rebal/Mod/BackoffController.hpp"
#include"Rebal/Msg/DbResource.hpp"
#include"S/Bus.hpp"
#include"Sqlite3.hpp"
#include<assert.h>
#include<functional>
#include<memory>

namespace {

auto const A = Ln::NodeId("020000000000000000000000000000000000000000000000000000000000000001");
auto const B = Ln::NodeId("020000000000000000000000000000000000000000000000000000000000000002");

auto const S1 = Ln::Scid("1x1x1");
auto const D1 = Ln::Scid("2x2x2");
auto const S2 = Ln::Scid("3x3x3");

Rebal::Channel channel(Ln::Scid const& id, Ln::NodeId const& peer, std::uint64_t local_sat) {
	auto ret = Rebal::Channel();
	ret.id = id;
	ret.peer = peer;
	ret.capacity = Ln::Amount::sat(1000000);
	ret.local = Ln::Amount::sat(local_sat);
	ret.remote = ret.capacity - ret.local;
	ret.active = true;
	ret.last_success = 0;
	return ret;
}

Ev::Io<void> fail_n( Rebal::Mod::BackoffController& backoff
		   , std::size_t n
		   , double now
		   ) {
	if (n == 0)
		return Ev::lift();
	return backoff.record_failure(S1, D1, "temporary channel failure", now
				     ).then([&backoff, n, now]() {
		return fail_n(backoff, n - 1, now);
	});
}

}

int main() {
	using Rebal::Mod::BackoffController;

	/* min(base * 2^n, max).  */
	assert(BackoffController::cooldown(0, 600, 86400) == 600);
	assert(BackoffController::cooldown(1, 600, 86400) == 1200);
	assert(BackoffController::cooldown(3, 600, 86400) == 4800);
	assert(BackoffController::cooldown(7, 600, 86400) == 76800);
	assert(BackoffController::cooldown(8, 600, 86400) == 86400);
	assert(BackoffController::cooldown(1000, 600, 86400) == 86400);

	auto bus = S::Bus();
	auto db = Sqlite3::Db(":memory:");
	auto config = Rebal::Config();
	config.cooldown_base = 600;
	config.cooldown_max = 86400;
	config.success_cooldown = 1800;
	config.failure_cap = 5;

	auto backoff = BackoffController(bus, config);

	auto channels = std::vector<Rebal::Channel>{
		channel(S1, A, 900000),
		channel(D1, B, 100000)
	};
	auto selected = [&](double now) {
		return Rebal::select_candidates(channels, config
					       , [&]( Ln::Scid const& s
						    , Ln::Scid const& d
						    ) {
			return backoff.is_excluded(s, d, now);
		}).size();
	};

	auto const now = double(1000000);

	auto code = Ev::lift().then([&]() {
		return bus.raise(Rebal::Msg::DbResource{db});
	}).then([&]() {
		assert(!backoff.is_excluded(S1, D1, now));
		assert(selected(now) == 1);

		backoff.mark_attempting(S1, D1);
		assert(backoff.is_attempting(S1, D1));
		backoff.release_attempt(S1, D1);
		assert(!backoff.is_attempting(S1, D1));

		backoff.mark_attempting(S1, D1);
		return backoff.record_failure(S1, D1, "no route", now);
	}).then([&]() {
		assert(!backoff.is_attempting(S1, D1));
		assert(backoff.failures(S1, D1) == 1);
		/* Excluded for 1200 seconds.  */
		assert(backoff.is_excluded(S1, D1, now + 1199));
		assert(!backoff.is_excluded(S1, D1, now + 1201));
		assert(selected(now + 1) == 0);
		assert(selected(now + 1201) == 1);
		/* Other pairs are unaffected.  */
		assert(!backoff.is_excluded(S2, D1, now));

		return backoff.record_failure(S1, D1, "no route", now);
	}).then([&]() {
		assert(backoff.failures(S1, D1) == 2);
		assert(backoff.is_excluded(S1, D1, now + 2399));
		assert(!backoff.is_excluded(S1, D1, now + 2401));

		/* Success resets the count.  */
		return backoff.record_success(S1, D1, now);
	}).then([&]() {
		assert(backoff.failures(S1, D1) == 0);
		assert(backoff.is_excluded(S1, D1, now + 1799));
		assert(!backoff.is_excluded(S1, D1, now + 1801));

		/* Reaching the cap is permanent.  */
		return fail_n(backoff, 5, now);
	}).then([&]() {
		assert(backoff.failures(S1, D1) == 5);
		assert(backoff.is_permanent(S1, D1));
		assert(backoff.is_excluded(S1, D1, now + 1e9));
		assert(selected(now + 1e9) == 0);

		/* Survives a restart.  */
		auto bus2 = std::make_shared<S::Bus>();
		auto backoff2 = std::make_shared<BackoffController>(*bus2, config);
		return bus2->raise(Rebal::Msg::DbResource{db}
				  ).then([bus2, backoff2, now]() {
			assert(backoff2->failures(S1, D1) == 5);
			assert(backoff2->is_excluded(S1, D1, now + 1e9));
			return Ev::lift();
		});
	}).then([&]() {
		/* Ambiguous outcomes exclude until resolved.  */
		return backoff.record_ambiguous(S2, D1, now);
	}).then([&]() {
		assert(backoff.is_excluded(S2, D1, now + 1e9));

		/* Resolving the ambiguous attempt lifts it.  */
		return backoff.record_failure(S2, D1, "failed", now);
	}).then([&]() {
		assert(!backoff.is_permanent(S2, D1));
		assert(!backoff.is_excluded(S2, D1, now + 1201));

		/* Left ambiguous again, never resolved.  */
		return backoff.record_ambiguous(S2, D1, now);
	}).then([&]() {
		assert(backoff.is_excluded(S2, D1, now + 1e9));

		/* Operator reset clears capped and unresolved
		 * pairs alike.  */
		return backoff.reset_permanent();
	}).then([&](std::size_t n) {
		assert(n == 2);
		assert(!backoff.is_excluded(S1, D1, now));
		assert(backoff.failures(S1, D1) == 0);
		assert(!backoff.is_excluded(S2, D1, now));
		assert(backoff.failures(S2, D1) == 0);

		/* Nothing left to clear.  */
		return backoff.reset_permanent();
	}).then([&](std::size_t n) {
		assert(n == 0);

		/* Capped but not permanent.  */
		config.permanent_exclusion = false;
		config.cap_cooldown = 604800;
		return fail_n(backoff, 5, now);
	}).then([&]() {
		assert(!backoff.is_permanent(S1, D1));
		assert(backoff.is_excluded(S1, D1, now + 604799));
		assert(!backoff.is_excluded(S1, D1, now + 604801));

		return Ev::lift(0);
	});

	return Ev::start(code);
}
