#include"Ev/Io.hpp"
#include"Ev/now.hpp"
#include"Ev/yield.hpp"
#include"Rebal/CandidateSelector.hpp"
#include"Rebal/Config.hpp"
#include"Rebal/Mod/AttemptHistory.hpp"
#include"Rebal/Mod/BackoffController.hpp"
#include"Rebal/Mod/ChannelMonitor.hpp"
#include"Rebal/Mod/FeeBudgeter.hpp"
#include"Rebal/Mod/PaymentExecutor.hpp"
#include"Rebal/Mod/RoutePlanner.hpp"
#include"Rebal/Mod/Scheduler.hpp"
#include"Rebal/Mod/Waiter.hpp"
#include"Rebal/Msg/ShutdownRequest.hpp"
#include"Rebal/RebalanceAttempt.hpp"
#include"Rebal/log.hpp"
#include"S/Bus.hpp"
#include"Util/make_unique.hpp"
#include"Util/stringify.hpp"
#include<set>
#include<vector>

namespace {

/* Longest single sleep between passes, so that a
 * shutdown request is noticed quickly.  */
auto constexpr sleep_slice = double(1.0);

/* How long resolved attempts stay in the history.  */
auto constexpr history_retention = double(30 * 86400);

std::string describe(Rebal::Candidate const& c) {
	return std::string(c.source.id)
	     + " -> "
	     + std::string(c.destination.id)
	     ;
}

}

namespace Rebal { namespace Mod {

class Scheduler::Impl {
private:
	S::Bus& bus;
	Mod::Waiter& waiter;
	Rebal::Config const& config;
	Mod::ChannelMonitor& monitor;
	Mod::RoutePlanner& planner;
	Mod::FeeBudgeter& budget;
	Mod::PaymentExecutor& executor;
	Mod::BackoffController& backoff;
	Mod::AttemptHistory& history;

	bool stopping;

	void start() {
		stopping = false;
		bus.subscribe<Msg::ShutdownRequest
			     >([this](Msg::ShutdownRequest const& m) {
			if (stopping)
				return Ev::lift();
			stopping = true;
			return Rebal::log( bus, Info
					 , "Scheduler: "
					   "Signal %d, stopping after "
					   "the current attempt."
					 , m.signum
					 );
		});
	}

	/* Updates the pair's backoff state from how an
	 * attempt ended.  */
	Ev::Io<void> apply(RebalanceAttempt const& a) {
		auto now = Ev::now();
		switch (a.status) {
		case Succeeded:
			return backoff.record_success( a.source, a.destination
						     , now
						     );
		case Failed:
			return backoff.record_failure( a.source, a.destination
						     , a.reason, now
						     );
		default:
			return backoff.record_ambiguous( a.source, a.destination
						       , now
						       );
		}
	}

	Ev::Io<void> reconcile_leftovers() {
		return history.unresolved().then([this
						 ](std::vector<RebalanceAttempt> as) {
			if (as.empty())
				return Ev::lift();
			auto pas = std::make_shared<std::vector<RebalanceAttempt>>(
				std::move(as)
			);
			return Rebal::log( bus, Info
					 , "Scheduler: "
					   "Re-querying %zu unresolved "
					   "attempts."
					 , pas->size()
					 ).then([this, pas]() {
				return reconcile_loop(pas, 0);
			});
		});
	}
	Ev::Io<void>
	reconcile_loop( std::shared_ptr<std::vector<RebalanceAttempt>> pas
		      , std::size_t i
		      ) {
		if (i >= pas->size())
			return Ev::lift();
		return executor.requery((*pas)[i]).then([this](RebalanceAttempt a) {
			if (a.status == Ambiguous)
				return Ev::lift();
			return apply(a);
		}).then([this, pas, i]() {
			return reconcile_loop(pas, i + 1);
		});
	}

	Ev::Io<void>
	abandon_loop( std::shared_ptr<std::vector<RebalanceAttempt>> pas
		    , std::size_t i
		    ) {
		if (i >= pas->size())
			return Ev::lift();
		return executor.abandon((*pas)[i]).then([this, pas, i
							](RebalanceAttempt) {
			return abandon_loop(pas, i + 1);
		});
	}

	/* Plans, budgets, and executes one candidate.
	 * Returns true if it succeeded.  */
	Ev::Io<bool> attempt(Candidate const& c) {
		backoff.mark_attempting(c.source.id, c.destination.id);
		return planner.plan(c).then([this](Plan plan) {
			auto pplan = std::make_shared<Plan>(std::move(plan));
			return budget.authorize( pplan->candidate.amount
					       , pplan->route.fee
					       , Ev::now()
					       ).then([this, pplan](Ln::Amount ceiling) {
				return executor.execute(*pplan, ceiling);
			});
		}).then([this](RebalanceAttempt a) {
			auto ok = a.status == Succeeded;
			return apply(a).then([ok]() {
				return Ev::lift(ok);
			});
		}).catching<NoRouteError>([this, c](NoRouteError const& e) {
			return ( Rebal::log( bus, Info
					   , "Scheduler: "
					     "No route for %s: %s"
					   , describe(c).c_str()
					   , e.what()
					   )
			       + backoff.record_failure( c.source.id
						       , c.destination.id
						       , std::string("no route: ")
						       + e.what()
						       , Ev::now()
						       )
			       ).then([]() {
				return Ev::lift(false);
			});
		}).catching<NoBudgetError>([this, c](NoBudgetError const& e) {
			backoff.release_attempt(c.source.id, c.destination.id);
			return Rebal::log( bus, Info
					 , "Scheduler: "
					   "Deferring %s: %s"
					 , describe(c).c_str()
					 , e.what()
					 ).then([]() {
				return Ev::lift(false);
			});
		}).catching<ConnectivityError>([this, c](ConnectivityError const& e) -> Ev::Io<bool> {
			backoff.release_attempt(c.source.id, c.destination.id);
			throw e;
		}).catching<NodeError>([this, c](NodeError const& e) -> Ev::Io<bool> {
			backoff.release_attempt(c.source.id, c.destination.id);
			throw e;
		});
	}

	Ev::Io<void>
	candidates_loop( std::shared_ptr<std::vector<Candidate>> cs
		       , std::size_t i
		       , std::size_t done
		       , std::shared_ptr<std::set<Ln::Scid>> touched
		       ) {
		if (i >= cs->size() || done >= config.max_candidates)
			return Ev::lift();
		if (stopping)
			return Rebal::log( bus, Debug
					 , "Scheduler: "
					   "Skipping remaining candidates "
					   "for shutdown."
					 );
		auto const& c = (*cs)[i];
		if ( touched->count(c.source.id) != 0
		  || touched->count(c.destination.id) != 0
		   )
			return Rebal::log( bus, Debug
					 , "Scheduler: "
					   "Skipping %s, rebalanced "
					   "earlier this pass."
					 , describe(c).c_str()
					 ).then([this, cs, i, done, touched]() {
				return candidates_loop(cs, i + 1, done, touched);
			});
		auto src = c.source.id;
		auto dst = c.destination.id;
		return attempt(c).then([ this
				       , cs, i, done, touched
				       , src, dst
				       ](bool ok) {
			if (ok) {
				touched->insert(src);
				touched->insert(dst);
			}
			return candidates_loop(cs, i + 1, done + 1, touched);
		});
	}

	Ev::Io<void> rebalance(std::vector<Channel> channels) {
		auto now = Ev::now();
		auto excluded = [this, now]( Ln::Scid const& s
					   , Ln::Scid const& d
					   ) {
			return backoff.is_excluded(s, d, now);
		};
		auto cs = std::make_shared<std::vector<Candidate>>(
			select_candidates(channels, config, excluded)
		);
		auto touched = std::make_shared<std::set<Ln::Scid>>();
		return Rebal::log( bus, Info
				 , "Scheduler: "
				   "%zu channels, %zu candidates, "
				   "fee budget left %s."
				 , channels.size()
				 , cs->size()
				 , Util::stringify(budget.remaining()).c_str()
				 ).then([this, cs, touched]() {
			return candidates_loop(cs, 0, 0, touched);
		});
	}

	Ev::Io<void> sleep_until(double deadline) {
		return Ev::lift().then([this, deadline]() {
			auto now = Ev::now();
			if (stopping || now >= deadline)
				return Ev::lift();
			auto slice = deadline - now;
			if (slice > sleep_slice)
				slice = sleep_slice;
			return waiter.wait(slice).then([this, deadline]() {
				return sleep_until(deadline);
			});
		});
	}

public:
	Impl( S::Bus& bus_
	    , Mod::Waiter& waiter_
	    , Rebal::Config const& config_
	    , Mod::ChannelMonitor& monitor_
	    , Mod::RoutePlanner& planner_
	    , Mod::FeeBudgeter& budget_
	    , Mod::PaymentExecutor& executor_
	    , Mod::BackoffController& backoff_
	    , Mod::AttemptHistory& history_
	    ) : bus(bus_)
	      , waiter(waiter_)
	      , config(config_)
	      , monitor(monitor_)
	      , planner(planner_)
	      , budget(budget_)
	      , executor(executor_)
	      , backoff(backoff_)
	      , history(history_)
	      { start(); }

	Ev::Io<void> prune_history() {
		return history.prune(Ev::now() - history_retention
				    ).then([this](std::size_t n) {
			if (n == 0)
				return Ev::lift();
			return Rebal::log( bus, Debug
					 , "Scheduler: "
					   "Pruned %zu old attempts from "
					   "history."
					 , n
					 );
		});
	}

	Ev::Io<void> pass() {
		return reconcile_leftovers().then([this]() {
			return prune_history();
		}).then([this]() {
			return monitor.refresh();
		}).then([this](std::vector<Channel> channels) {
			return rebalance(std::move(channels));
		}).catching<ConnectivityError>([this](ConnectivityError const& e) {
			return Rebal::log( bus, Warn
					 , "Scheduler: "
					   "Node unreachable, pass "
					   "abandoned: %s"
					 , e.what()
					 );
		}).catching<NodeError>([this](NodeError const& e) {
			return Rebal::log( bus, Warn
					 , "Scheduler: "
					   "Node error, pass abandoned: %s"
					 , e.what()
					 );
		});
	}

	Ev::Io<std::size_t> reset_exclusions() {
		return history.unresolved().then([this
						 ](std::vector<RebalanceAttempt> as) {
			auto pas = std::make_shared<std::vector<RebalanceAttempt>>(
				std::move(as)
			);
			return Rebal::log( bus, Info
					 , "Scheduler: "
					   "Abandoning %zu unresolved "
					   "attempts."
					 , pas->size()
					 ).then([this, pas]() {
				return abandon_loop(pas, 0);
			});
		}).then([this]() {
			return backoff.reset_permanent();
		});
	}

	Ev::Io<void> run() {
		return Ev::yield().then([this]() {
			if (stopping)
				return Rebal::log( bus, Info
						 , "Scheduler: Stopped."
						 );
			auto deadline = Ev::now() + config.poll_interval;
			return pass().then([this, deadline]() {
				return sleep_until(deadline);
			}).then([this]() {
				return run();
			});
		});
	}
};

Scheduler::Scheduler(Scheduler&&) =default;
Scheduler::~Scheduler() =default;

Scheduler::Scheduler( S::Bus& bus
		    , Mod::Waiter& waiter
		    , Rebal::Config const& config
		    , Mod::ChannelMonitor& monitor
		    , Mod::RoutePlanner& planner
		    , Mod::FeeBudgeter& budget
		    , Mod::PaymentExecutor& executor
		    , Mod::BackoffController& backoff
		    , Mod::AttemptHistory& history
		    ) : pimpl(Util::make_unique<Impl>( bus, waiter, config
						     , monitor, planner
						     , budget, executor
						     , backoff, history
						     )) { }

Ev::Io<void> Scheduler::run() {
	return pimpl->run();
}
Ev::Io<void> Scheduler::pass() {
	return pimpl->pass();
}
Ev::Io<std::size_t> Scheduler::reset_exclusions() {
	return pimpl->reset_exclusions();
}

}}
