#include"Ev/Io.hpp"
#include"Ev/now.hpp"
#include"Rebal/Config.hpp"
#include"Rebal/Mod/FeeBudgeter.hpp"
#include"Rebal/Mod/PaymentExecutor.hpp"
#include"Rebal/Mod/RoutePlanner.hpp"
#include"Rebal/Mod/Waiter.hpp"
#include"Rebal/Msg/AttemptResolved.hpp"
#include"Rebal/RebalanceAttempt.hpp"
#include"Rebal/bounded.hpp"
#include"Rebal/log.hpp"
#include"S/Bus.hpp"
#include"Util/Str.hpp"
#include"Util/make_unique.hpp"
#include"Util/stringify.hpp"

namespace {

/* Status polls never wait longer than this.  */
auto constexpr max_poll_interval = double(30);
/* Factor by which the poll interval grows.  */
auto constexpr poll_backoff = double(1.5);

std::string describe(Rebal::RebalanceAttempt const& a) {
	return std::string(a.source) + " -> " + std::string(a.destination);
}

}

namespace Rebal { namespace Mod {

class PaymentExecutor::Impl {
private:
	S::Bus& bus;
	Mod::Waiter& waiter;
	Rebal::Config const& config;
	Rebal::NodeIF& node;
	Mod::FeeBudgeter& budget;

	typedef std::shared_ptr<RebalanceAttempt> Ptr;

	/* Asks the node once, updating the attempt.
	 * Returns true if the attempt is now terminal.
	 * Not hearing from the node is not an answer.  */
	Ev::Io<bool> query(Ptr a) {
		return bounded( waiter, config.call_timeout
			      , node.get_payment_status(a->attempt_id)
			      ).then([a](PaymentStatus s) {
			switch (s.type) {
			case PaymentStatus::Succeeded:
				a->status = Succeeded;
				a->fee = s.fee;
				a->fee_known = true;
				a->reason = "";
				return Ev::lift(true);
			case PaymentStatus::Failed:
				a->status = Failed;
				a->reason = s.reason;
				return Ev::lift(true);
			case PaymentStatus::Pending:
				break;
			}
			return Ev::lift(false);
		}).catching<ConnectivityError>([this, a](ConnectivityError const& e) {
			return Rebal::log( bus, Debug
					 , "PaymentExecutor: "
					   "Status of %s unavailable: %s"
					 , a->attempt_id.c_str()
					 , e.what()
					 ).then([]() {
				return Ev::lift(false);
			});
		}).catching<NodeError>([this, a](NodeError const& e) {
			return Rebal::log( bus, Debug
					 , "PaymentExecutor: "
					   "Status of %s unavailable: %s"
					 , a->attempt_id.c_str()
					 , e.what()
					 ).then([]() {
				return Ev::lift(false);
			});
		});
	}

	/* Waits, queries, and repeats with a longer wait
	 * until the attempt is terminal.
	 * Throws AmbiguousOutcome once the deadline is
	 * passed.  */
	Ev::Io<void> poll(Ptr a, double deadline, double interval) {
		return waiter.wait(interval).then([this, a]() {
			return query(a);
		}).then([this, a, deadline, interval](bool done) {
			if (done)
				return Ev::lift();
			if (Ev::now() >= deadline)
				throw AmbiguousOutcome(Util::Str::fmt(
					"No final status after %.0f seconds",
					config.status_poll_timeout
				));
			auto next = interval * poll_backoff;
			if (next > max_poll_interval)
				next = max_poll_interval;
			if (next < interval)
				next = interval;
			return poll(a, deadline, next);
		});
	}

	/* Repeated queries for an Ambiguous attempt.  */
	Ev::Io<void> reconcile(Ptr a, std::size_t tries) {
		if (tries == 0)
			return Ev::lift();
		return waiter.wait(config.reconcile_interval).then([this, a]() {
			return query(a);
		}).then([this, a, tries](bool done) {
			if (done)
				return Rebal::log( bus, Info
						 , "PaymentExecutor: "
						   "Reconciled %s: %s"
						 , a->attempt_id.c_str()
						 , status_string(a->status)
						 );
			return reconcile(a, tries - 1);
		});
	}

	/* A failed attempt's invoice can never be paid,
	 * so do not leave it on the node.  */
	Ev::Io<void> forget_invoice(Ptr a) {
		if (a->status != Failed || a->payment_hash == "")
			return Ev::lift();
		return bounded( waiter, config.call_timeout
			      , node.cancel_invoice(a->payment_hash)
			      ).catching<ConnectivityError
					>([this, a](ConnectivityError const& e) {
			return Rebal::log( bus, Debug
					 , "PaymentExecutor: "
					   "Could not delete invoice %s: %s"
					 , a->payment_hash.c_str()
					 , e.what()
					 );
		}).catching<NodeError>([this, a](NodeError const& e) {
			return Rebal::log( bus, Debug
					 , "PaymentExecutor: "
					   "Could not delete invoice %s: %s"
					 , a->payment_hash.c_str()
					 , e.what()
					 );
		});
	}

	/* Logs and announces an attempt that is done
	 * with, even if left Ambiguous.  */
	Ev::Io<void> announce(Ptr a) {
		if (a->terminal())
			a->resolved = Ev::now();
		auto act = Ev::lift();
		switch (a->status) {
		case Succeeded:
			act = Rebal::log( bus, Info
					, "PaymentExecutor: "
					  "Rebalanced %s %s, fee %s "
					  "(ceiling %s)."
					, describe(*a).c_str()
					, Util::stringify(a->amount).c_str()
					, Util::stringify(a->fee).c_str()
					, Util::stringify(a->fee_ceiling).c_str()
					);
			break;
		case Failed:
			act = Rebal::log( bus, Info
					, "PaymentExecutor: "
					  "Failed to rebalance %s %s "
					  "(fee ceiling %s): %s"
					, describe(*a).c_str()
					, Util::stringify(a->amount).c_str()
					, Util::stringify(a->fee_ceiling).c_str()
					, a->reason.c_str()
					);
			break;
		default:
			act = Rebal::log( bus, Warn
					, "PaymentExecutor: "
					  "Outcome of rebalancing %s %s "
					  "(fee ceiling %s, attempt %s) "
					  "unknown: %s"
					, describe(*a).c_str()
					, Util::stringify(a->amount).c_str()
					, Util::stringify(a->fee_ceiling).c_str()
					, a->attempt_id.c_str()
					, a->reason.c_str()
					);
			break;
		}
		return act
		     + forget_invoice(a)
		     + bus.raise(Msg::AttemptResolved{*a})
		     ;
	}

	Ev::Io<void> submit( Ptr a
			   , Rebal::Invoice const& invoice
			   , Rebal::Route const& route
			   ) {
		a->status = InFlight;
		return Rebal::log( bus, Debug
				 , "PaymentExecutor: "
				   "Paying %s for %s over %zu hops, "
				   "fee ceiling %s."
				 , a->payment_hash.c_str()
				 , describe(*a).c_str()
				 , route.channels.size()
				 , Util::stringify(a->fee_ceiling).c_str()
				 ).then([this, a, invoice, route]() {
			return bounded( waiter, config.call_timeout
				      , node.pay_invoice( invoice
							, a->fee_ceiling
							, route
							)
				      );
		}).then([a](std::string attempt_id) {
			a->attempt_id = attempt_id;
			return Ev::lift();
		}).catching<PaymentFailed>([a](PaymentFailed const& e) {
			a->status = Failed;
			a->reason = e.what();
			return Ev::lift();
		}).catching<NodeError>([a](NodeError const& e) {
			a->status = Failed;
			a->reason = e.what();
			return Ev::lift();
		}).catching<ConnectivityError>([a](ConnectivityError const& e) {
			/* The node might have taken the payment
			 * anyway; follow it by its hash.  */
			a->status = Ambiguous;
			a->attempt_id = a->payment_hash;
			a->reason = e.what();
			return Ev::lift();
		});
	}

	/* Holds the ceiling, reconciles, and settles the
	 * hold if the attempt got resolved.  */
	Ev::Io<void> resolve_ambiguous(Ptr a) {
		return budget.hold( a->attempt_id, a->fee_ceiling
				  , Ev::now()
				  ).then([this, a]() {
			return reconcile(a, config.reconcile_attempts);
		}).then([this, a]() {
			if (!a->terminal())
				return Ev::lift();
			return budget.settle( a->attempt_id
					    , a->status == Succeeded
					    , a->fee
					    , Ev::now()
					    );
		});
	}

public:
	Impl( S::Bus& bus_
	    , Mod::Waiter& waiter_
	    , Rebal::Config const& config_
	    , Rebal::NodeIF& node_
	    , Mod::FeeBudgeter& budget_
	    ) : bus(bus_)
	      , waiter(waiter_)
	      , config(config_)
	      , node(node_)
	      , budget(budget_)
	      { }

	Ev::Io<RebalanceAttempt>
	execute(Plan const& plan, Ln::Amount fee_ceiling) {
		auto a = std::make_shared<RebalanceAttempt>();
		a->source = plan.candidate.source.id;
		a->destination = plan.candidate.destination.id;
		a->amount = plan.candidate.amount;
		a->fee_ceiling = fee_ceiling;
		a->status = Pending;
		a->created = Ev::now();
		a->resolved = 0;
		a->fee = Ln::Amount::msat(0);
		a->fee_known = false;

		auto route = plan.route;
		auto description = "rebalance " + describe(*a);
		return bounded( waiter, config.call_timeout
			      , node.create_invoice(a->amount, description)
			      ).then([this, a, route](Invoice invoice) {
			a->payment_hash = invoice.payment_hash;
			return submit(a, invoice, route);
		}).then([this, a]() {
			if (a->status != InFlight)
				return Ev::lift();
			auto deadline = Ev::now() + config.status_poll_timeout;
			return poll( a, deadline
				   , config.status_poll_interval
				   ).catching<AmbiguousOutcome
					     >([a](AmbiguousOutcome const& e) {
				a->status = Ambiguous;
				a->reason = e.what();
				return Ev::lift();
			});
		}).then([this, a]() {
			if (a->status == Ambiguous)
				return resolve_ambiguous(a);
			if (a->status == Succeeded)
				return budget.charge(a->fee, Ev::now());
			return Ev::lift();
		}).then([this, a]() {
			return announce(a);
		}).then([a]() {
			return Ev::lift(*a);
		});
	}

	Ev::Io<RebalanceAttempt> requery(RebalanceAttempt const& attempt) {
		auto a = std::make_shared<RebalanceAttempt>(attempt);
		return query(a).then([this, a](bool done) {
			if (!done)
				return Rebal::log( bus, Debug
						 , "PaymentExecutor: "
						   "%s still unresolved."
						 , a->attempt_id.c_str()
						 );
			return budget.settle( a->attempt_id
					    , a->status == Succeeded
					    , a->fee
					    , Ev::now()
					    ).then([this, a]() {
				return announce(a);
			});
		}).then([a]() {
			return Ev::lift(*a);
		});
	}

	Ev::Io<RebalanceAttempt> abandon(RebalanceAttempt const& attempt) {
		auto a = std::make_shared<RebalanceAttempt>(attempt);
		a->status = Failed;
		a->reason = "abandoned by reset";
		return budget.settle( a->attempt_id, false
				    , Ln::Amount::msat(0)
				    , Ev::now()
				    ).then([this, a]() {
			return announce(a);
		}).then([a]() {
			return Ev::lift(*a);
		});
	}
};

PaymentExecutor::PaymentExecutor(PaymentExecutor&&) =default;
PaymentExecutor::~PaymentExecutor() =default;

PaymentExecutor::PaymentExecutor( S::Bus& bus
				, Mod::Waiter& waiter
				, Rebal::Config const& config
				, Rebal::NodeIF& node
				, Mod::FeeBudgeter& budget
				) : pimpl(Util::make_unique<Impl>( bus, waiter
								 , config
								 , node
								 , budget
								 )) { }

Ev::Io<RebalanceAttempt>
PaymentExecutor::execute(Plan const& plan, Ln::Amount fee_ceiling) {
	return pimpl->execute(plan, fee_ceiling);
}
Ev::Io<RebalanceAttempt>
PaymentExecutor::requery(RebalanceAttempt const& attempt) {
	return pimpl->requery(attempt);
}
Ev::Io<RebalanceAttempt>
PaymentExecutor::abandon(RebalanceAttempt const& attempt) {
	return pimpl->abandon(attempt);
}

}}
