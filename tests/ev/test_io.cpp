#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include<assert.h>
#include<stdexcept>
#include<string>
#include<vector>

int main() {
	auto trace = std::vector<std::string>();
	auto step = [&](char const* name) {
		return Ev::lift().then([&trace, name]() {
			trace.push_back(name);
			return Ev::lift();
		});
	};

	/* Sequencing with + and +=.  */
	auto act = step("fetch") + step("select");
	act += step("plan");
	act = std::move(act) + step("pay");

	auto code = Ev::lift().then([&]() {
		assert(trace.empty());
		return act;
	}).then([&]() {
		assert(trace.size() == 4);
		assert(trace[0] == "fetch");
		assert(trace[3] == "pay");
		trace.clear();

		/* A concurrent greenthread only runs once we
		 * give up control.  */
		return Ev::concurrent(step("background"));
	}).then([&]() {
		assert(trace.empty());
		return Ev::yield();
	}).then([&]() {
		assert(trace.size() == 1);
		assert(trace[0] == "background");

		/* Exceptions skip the remaining steps.  */
		trace.clear();
		return ( step("before")
		       + Ev::lift().then([]() -> Ev::Io<void> {
				throw std::runtime_error("node unreachable");
			 })
		       + step("after")
		       ).then([]() {
			return Ev::lift(std::string("completed"));
		}).catching<std::runtime_error>([](std::runtime_error const& e) {
			return Ev::lift(std::string(e.what()));
		});
	}).then([&](std::string what) {
		assert(what == "node unreachable");
		assert(trace.size() == 1);
		assert(trace[0] == "before");

		/* Handlers for other types do not intercept.  */
		return Ev::yield().then([]() {
			throw int(42);
			return Ev::lift(1);
		}).catching<std::exception>([](std::exception const&) {
			return Ev::lift(2);
		}).catching<int>([](int v) {
			return Ev::lift(v);
		});
	}).then([&](int v) {
		assert(v == 42);

		/* A handler may rethrow as something else.  */
		return Ev::lift().then([]() -> Ev::Io<int> {
			throw std::out_of_range("timeout");
		}).catching<std::out_of_range>([](std::out_of_range const&) -> Ev::Io<int> {
			throw std::invalid_argument("converted");
		}).catching<std::invalid_argument>([](std::invalid_argument const& e) {
			return Ev::lift(int(std::string(e.what()).size()));
		});
	}).then([&](int len) {
		assert(len == 9);
		return Ev::lift(0);
	});

	return Ev::start(code);
}
