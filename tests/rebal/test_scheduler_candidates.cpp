#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/now.hpp"
#include"Ev/start.hpp"
#include"Rebal/Channel.hpp"
#include"Rebal/Config.hpp"
#include"Rebal/Mod/AttemptHistory.hpp"
#include"Rebal/Mod/BackoffController.hpp"
#include"Rebal/Mod/ChannelMonitor.hpp"
#include"Rebal/Mod/FeeBudgeter.hpp"
#include"Rebal/Mod/Logger.hpp"
#include"Rebal/Mod/PaymentExecutor.hpp"
#include"Rebal/Mod/RoutePlanner.hpp"
#include"Rebal/Mod/Scheduler.hpp"
#include"Rebal/Mod/Waiter.hpp"
#include"Rebal/Msg/DbResource.hpp"
#include"Rebal/Msg/ShutdownRequest.hpp"
#include"Rebal/NodeIF.hpp"
#include"Rebal/RebalanceAttempt.hpp"
#include"Rebal/Shutdown.hpp"
#include"S/Bus.hpp"
#include"Sqlite3.hpp"
#include<assert.h>
#include<functional>
#include<iostream>

namespace {

auto const msat = [](std::uint64_t v) { return Ln::Amount::msat(v); };
auto const sat = [](std::uint64_t v) { return Ln::Amount::sat(v); };

auto const P1 = "020000000000000000000000000000000000000000000000000000000000000001";
auto const P2 = "020000000000000000000000000000000000000000000000000000000000000002";
auto const P3 = "020000000000000000000000000000000000000000000000000000000000000003";
auto const P4 = "020000000000000000000000000000000000000000000000000000000000000004";

Rebal::Channel channel(char const* id, char const* peer, std::uint64_t local) {
	auto ret = Rebal::Channel();
	ret.id = Ln::Scid(id);
	ret.peer = Ln::NodeId(peer);
	ret.capacity = sat(1000000);
	ret.local = sat(local);
	ret.remote = sat(1000000 - local);
	ret.active = true;
	ret.last_success = 0;
	return ret;
}

class FakeNode : public Rebal::NodeIF {
public:
	std::vector<Rebal::Channel> channels;
	std::function<Ev::Io<Rebal::Route>(Rebal::RouteHints const&)> route;
	std::function<Ev::Io<Rebal::PaymentStatus>()> status;

	std::size_t listings = 0;
	std::size_t invoices = 0;
	std::size_t payments = 0;
	std::size_t polls = 0;
	std::vector<Rebal::RouteHints> routed;

	Ev::Io<std::vector<Rebal::Channel>> list_channels() override {
		return Ev::lift().then([this]() {
			++listings;
			return Ev::lift(channels);
		});
	}
	Ev::Io<Rebal::Invoice> create_invoice( Ln::Amount amount
					     , std::string const&
					     ) override {
		return Ev::lift().then([this, amount]() {
			++invoices;
			auto ret = Rebal::Invoice();
			ret.id = "lnbcrt" + std::to_string(invoices);
			ret.payment_hash = "hash" + std::to_string(invoices);
			ret.amount = amount;
			ret.min_final_cltv_expiry = 18;
			return Ev::lift(ret);
		});
	}
	Ev::Io<Rebal::Route> find_route( Rebal::RouteHints const& hints
				       , Ln::Amount
				       ) override {
		return Ev::lift().then([this, hints]() {
			routed.push_back(hints);
			return route(hints);
		});
	}
	Ev::Io<std::string> pay_invoice( Rebal::Invoice const& invoice
				       , Ln::Amount
				       , Rebal::Route const&
				       ) override {
		return Ev::lift().then([this, invoice]() {
			++payments;
			return Ev::lift(invoice.payment_hash);
		});
	}
	Ev::Io<Rebal::PaymentStatus>
	get_payment_status(std::string const&) override {
		return Ev::lift().then([this]() {
			++polls;
			return status();
		});
	}
	Ev::Io<void> cancel_invoice(std::string const&) override {
		return Ev::lift();
	}
};

Rebal::Route through(Rebal::RouteHints const& hints, std::uint64_t fee) {
	auto ret = Rebal::Route();
	ret.channels.push_back(hints.source);
	ret.channels.push_back(Ln::Scid("900x9x0"));
	ret.channels.push_back(hints.destination);
	ret.fee = msat(fee);
	return ret;
}

Rebal::PaymentStatus pending() {
	auto ret = Rebal::PaymentStatus();
	ret.type = Rebal::PaymentStatus::Pending;
	return ret;
}
Rebal::PaymentStatus succeeded(std::uint64_t fee) {
	auto ret = Rebal::PaymentStatus();
	ret.type = Rebal::PaymentStatus::Succeeded;
	ret.fee = msat(fee);
	return ret;
}

bool same( Rebal::RouteHints const& h
	 , Ln::Scid const& source
	 , Ln::Scid const& destination
	 ) {
	return h.source == source && h.destination == destination;
}

}

int main() {
	auto bus = S::Bus();
	auto logger = Rebal::Mod::Logger(std::cerr, bus, Rebal::Debug);
	auto waiter = Rebal::Mod::Waiter(bus);
	auto db = Sqlite3::Db(":memory:");

	auto config = Rebal::Config();
	config.poll_interval = 0.05;
	config.call_timeout = 1;
	config.status_poll_interval = 0.01;
	config.status_poll_timeout = 1;
	config.reconcile_interval = 0.01;

	auto node = FakeNode();
	auto history = Rebal::Mod::AttemptHistory(bus);
	auto budget = Rebal::Mod::FeeBudgeter(bus, config);
	auto backoff = Rebal::Mod::BackoffController(bus, config);
	auto monitor = Rebal::Mod::ChannelMonitor( bus, waiter, config
						 , node, history
						 );
	auto planner = Rebal::Mod::RoutePlanner(bus, waiter, config, node);
	auto executor = Rebal::Mod::PaymentExecutor( bus, waiter, config
						   , node, budget
						   );
	auto scheduler = Rebal::Mod::Scheduler( bus, waiter, config
					      , monitor, planner
					      , budget, executor
					      , backoff, history
					      );

	auto const S1 = Ln::Scid("100x1x0");
	auto const S2 = Ln::Scid("110x1x0");
	auto const D1 = Ln::Scid("200x2x0");
	auto const D2 = Ln::Scid("210x2x0");
	auto const S3 = Ln::Scid("300x3x0");
	auto const S4 = Ln::Scid("310x3x0");
	auto const D3 = Ln::Scid("400x4x0");
	auto const D4 = Ln::Scid("410x4x0");
	auto const S5 = Ln::Scid("500x5x0");
	auto const D5 = Ln::Scid("600x6x0");

	node.status = []() {
		return Ev::lift(succeeded(1000));
	};

	auto code = Ev::lift().then([&]() {
		return bus.raise(Rebal::Msg::DbResource{db});
	}).then([&]() {
		/* Ranked S1->D1, S1->D2, S2->D1, S2->D2.
		 * The node cannot route the first pair, which
		 * costs that pair alone.  */
		config.max_candidates = 2;
		node.channels = std::vector<Rebal::Channel>{
			channel("100x1x0", P1, 950000),
			channel("110x1x0", P2, 900000),
			channel("200x2x0", P3, 50000),
			channel("210x2x0", P4, 100000)
		};
		node.route = [&](Rebal::RouteHints const& h) -> Ev::Io<Rebal::Route> {
			if (same(h, S1, D1))
				throw Rebal::NodeError("no channel update for 200x2x0");
			return Ev::lift(through(h, 1000));
		};
		return scheduler.pass();
	}).then([&]() {
		assert(node.routed.size() == 2);
		assert(same(node.routed[0], S1, D1));
		assert(same(node.routed[1], S1, D2));
		assert(node.payments == 1);
		assert(backoff.failures(S1, D1) == 1);
		assert(backoff.is_excluded(S1, D1, Ev::now()));
		assert(backoff.is_excluded(S1, D2, Ev::now()));
		/* The limit stopped the pass before S2->D1.  */
		assert(!backoff.is_excluded(S2, D1, Ev::now()));
		assert(backoff.failures(S2, D1) == 0);

		/* The next pass moves on to the other pairs
		 * instead of retrying the unroutable one.
		 * S2->D2 shares S2 with S2->D1, so it waits.  */
		node.routed.clear();
		return scheduler.pass();
	}).then([&]() {
		assert(node.routed.size() == 1);
		assert(same(node.routed[0], S2, D1));
		assert(node.payments == 2);
		assert(!backoff.is_excluded(S2, D2, Ev::now()));

		/* Ranked S3->D3, S3->D4, S4->D3, S4->D4.
		 * Once S3->D3 is done, the two pairs sharing
		 * one of its channels are stale and skipped,
		 * without counting against the limit.  */
		config.max_candidates = 3;
		node.routed.clear();
		node.payments = 0;
		node.channels = std::vector<Rebal::Channel>{
			channel("300x3x0", P1, 950000),
			channel("310x3x0", P2, 900000),
			channel("400x4x0", P3, 50000),
			channel("410x4x0", P4, 100000)
		};
		node.route = [](Rebal::RouteHints const& h) {
			return Ev::lift(through(h, 1000));
		};
		return scheduler.pass();
	}).then([&]() {
		assert(node.routed.size() == 2);
		assert(same(node.routed[0], S3, D3));
		assert(same(node.routed[1], S4, D4));
		assert(node.payments == 2);
		assert(!backoff.is_excluded(S3, D4, Ev::now()));
		assert(!backoff.is_excluded(S4, D3, Ev::now()));

		/* A shutdown request while the payment is
		 * being polled: the attempt still runs to its
		 * end before run() returns.  */
		node.routed.clear();
		node.payments = 0;
		node.polls = 0;
		node.channels = std::vector<Rebal::Channel>{
			channel("500x5x0", P1, 950000),
			channel("600x6x0", P3, 50000)
		};
		node.status = [&]() {
			if (node.polls == 1)
				return bus.raise(Rebal::Msg::ShutdownRequest{15}
						).then([]() {
					return Ev::lift(pending());
				});
			return Ev::lift(succeeded(700));
		};
		auto start = node.listings;
		return scheduler.run().then([&node, start]() {
			assert(node.listings == start + 1);
			return Ev::lift();
		});
	}).then([&]() {
		assert(node.payments == 1);
		assert(node.polls == 2);
		assert(backoff.is_excluded(S5, D5, Ev::now()));
		assert(!backoff.is_attempting(S5, D5));
		return history.recent(1);
	}).then([&](std::vector<Rebal::RebalanceAttempt> as) {
		assert(as.size() == 1);
		assert(as[0].source == S5);
		assert(as[0].destination == D5);
		assert(as[0].status == Rebal::Succeeded);
		assert(as[0].fee == msat(700));

		return bus.raise(Rebal::Shutdown());
	}).then([]() {
		return Ev::lift(0);
	});

	return Ev::start(code);
}
