#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Rebal/CandidateSelector.hpp"
#include"Rebal/Channel.hpp"
#include"Rebal/Config.hpp"
#include"Rebal/Mod/Logger.hpp"
#include"Rebal/Mod/RoutePlanner.hpp"
#include"Rebal/Mod/Waiter.hpp"
#include"Rebal/NodeIF.hpp"
#include"Rebal/Shutdown.hpp"
#include"S/Bus.hpp"
#include<assert.h>
#include<functional>
#include<iostream>

namespace {

Rebal::Channel channel(char const* id, char const* peer) {
	auto ret = Rebal::Channel();
	ret.id = Ln::Scid(id);
	ret.peer = Ln::NodeId(peer);
	ret.capacity = Ln::Amount::sat(1000000);
	ret.local = Ln::Amount::sat(500000);
	ret.remote = Ln::Amount::sat(500000);
	ret.active = true;
	ret.last_success = 0;
	return ret;
}

auto const A = "020000000000000000000000000000000000000000000000000000000000000001";
auto const B = "020000000000000000000000000000000000000000000000000000000000000002";

class FakeNode : public Rebal::NodeIF {
public:
	std::function<Ev::Io<Rebal::Route>()> route;
	std::size_t calls = 0;
	Rebal::RouteHints last_hints;
	Ln::Amount last_amount;

	Ev::Io<std::vector<Rebal::Channel>> list_channels() override {
		return Ev::lift(std::vector<Rebal::Channel>());
	}
	Ev::Io<Rebal::Invoice> create_invoice( Ln::Amount
					     , std::string const&
					     ) override {
		return Ev::lift().then([]() -> Ev::Io<Rebal::Invoice> {
			throw Rebal::NodeError("not used");
		});
	}
	Ev::Io<Rebal::Route> find_route( Rebal::RouteHints const& hints
				       , Ln::Amount amount
				       ) override {
		return Ev::lift().then([this, hints, amount]() {
			++calls;
			last_hints = hints;
			last_amount = amount;
			return route();
		});
	}
	Ev::Io<std::string> pay_invoice( Rebal::Invoice const&
				       , Ln::Amount
				       , Rebal::Route const&
				       ) override {
		return Ev::lift().then([]() -> Ev::Io<std::string> {
			throw Rebal::NodeError("not used");
		});
	}
	Ev::Io<Rebal::PaymentStatus>
	get_payment_status(std::string const&) override {
		return Ev::lift().then([]() -> Ev::Io<Rebal::PaymentStatus> {
			throw Rebal::NodeError("not used");
		});
	}
	Ev::Io<void> cancel_invoice(std::string const&) override {
		return Ev::lift().then([]() -> Ev::Io<void> {
			throw Rebal::NodeError("not used");
		});
	}
};

Rebal::Route make_route(std::vector<char const*> scids, std::uint64_t fee) {
	auto ret = Rebal::Route();
	for (auto s : scids)
		ret.channels.push_back(Ln::Scid(s));
	ret.fee = Ln::Amount::msat(fee);
	return ret;
}

}

int main() {
	auto bus = S::Bus();
	auto logger = Rebal::Mod::Logger(std::cerr, bus, Rebal::Debug);
	auto waiter = Rebal::Mod::Waiter(bus);
	auto config = Rebal::Config();
	config.call_timeout = 0.05;
	auto node = FakeNode();
	auto planner = Rebal::Mod::RoutePlanner(bus, waiter, config, node);

	auto candidate = Rebal::Candidate();
	candidate.source = channel("100x1x0", A);
	candidate.destination = channel("200x2x0", B);
	candidate.amount = Ln::Amount::sat(100000);
	candidate.deficiency = Ln::Amount::sat(200000);

	/* Classifies how a plan attempt ended.  */
	auto outcome = [&]() {
		return planner.plan(candidate).then([](Rebal::Plan) {
			return Ev::lift(std::string("ok"));
		}).catching<Rebal::NoRouteError
			   >([](Rebal::NoRouteError const&) {
			return Ev::lift(std::string("noroute"));
		}).catching<Rebal::ConnectivityError
			   >([](Rebal::ConnectivityError const&) {
			return Ev::lift(std::string("connectivity"));
		}).catching<Rebal::NodeError>([](Rebal::NodeError const&) {
			return Ev::lift(std::string("node"));
		});
	};

	auto code = Ev::lift().then([&]() {
		node.route = []() {
			return Ev::lift(make_route({ "100x1x0"
						   , "300x3x0"
						   , "200x2x0"
						   }, 2100));
		};
		return planner.plan(candidate);
	}).then([&](Rebal::Plan plan) {
		assert(node.calls == 1);
		assert(node.last_hints.source == Ln::Scid("100x1x0"));
		assert(node.last_hints.destination == Ln::Scid("200x2x0"));
		assert(node.last_amount == Ln::Amount::sat(100000));
		assert(plan.hints.source == Ln::Scid("100x1x0"));
		assert(plan.hints.destination == Ln::Scid("200x2x0"));
		assert(plan.route.channels.size() == 3);
		assert(plan.route.fee == Ln::Amount::msat(2100));
		assert(plan.candidate.amount == Ln::Amount::sat(100000));

		/* A route not leaving through the source.  */
		node.route = []() {
			return Ev::lift(make_route({ "300x3x0"
						   , "200x2x0"
						   }, 100));
		};
		return outcome();
	}).then([&](std::string r) {
		assert(r == "noroute");

		/* A route not coming back through the
		 * destination.  */
		node.route = []() {
			return Ev::lift(make_route({ "100x1x0"
						   , "300x3x0"
						   }, 100));
		};
		return outcome();
	}).then([&](std::string r) {
		assert(r == "noroute");

		/* Too short.  */
		node.route = []() {
			return Ev::lift(make_route({"100x1x0"}, 0));
		};
		return outcome();
	}).then([&](std::string r) {
		assert(r == "noroute");

		/* The node itself finds nothing.  */
		node.route = []() -> Ev::Io<Rebal::Route> {
			throw Rebal::NoRouteError("no path");
		};
		return outcome();
	}).then([&](std::string r) {
		assert(r == "noroute");

		/* An error answer is no route for this pair,
		 * not trouble with the node as a whole.  */
		node.route = []() -> Ev::Io<Rebal::Route> {
			throw Rebal::NodeError("no channel update for 200x2x0");
		};
		return outcome();
	}).then([&](std::string r) {
		assert(r == "noroute");

		/* The node never answers.  */
		node.route = [&]() {
			return waiter.wait(60).then([]() {
				return Ev::lift(make_route({ "100x1x0"
							   , "200x2x0"
							   }, 0));
			});
		};
		return outcome();
	}).then([&](std::string r) {
		assert(r == "connectivity");

		return bus.raise(Rebal::Shutdown());
	}).then([]() {
		return Ev::lift(0);
	});

	return Ev::start(code);
}
