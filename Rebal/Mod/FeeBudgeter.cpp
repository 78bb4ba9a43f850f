#include"Ev/Io.hpp"
#include"Rebal/Config.hpp"
#include"Rebal/Mod/FeeBudgeter.hpp"
#include"Rebal/Msg/DbResource.hpp"
#include"Rebal/log.hpp"
#include"S/Bus.hpp"
#include"Sqlite3.hpp"
#include"Util/make_unique.hpp"
#include"Util/stringify.hpp"
#include<cmath>
#include<cstdint>
#include<map>

namespace Rebal { namespace Mod {

class FeeBudgeter::Impl {
private:
	S::Bus& bus;
	Rebal::Config const& config;

	Sqlite3::Db db;

	std::uint64_t epoch;
	/* Includes holds.  */
	Ln::Amount spent;

	struct Hold {
		std::uint64_t epoch;
		Ln::Amount amount;
	};
	std::map<std::string, Hold> holds;

	void start() {
		bus.subscribe<Msg::DbResource
			     >([this](Msg::DbResource const& m) {
			db = m.db;
			return db.transact().then([this](Sqlite3::Tx tx) {
				tx.query_execute(R"QRY(
				CREATE TABLE IF NOT EXISTS "FeeBudget"
				     ( id INTEGER PRIMARY KEY
				     , epoch INTEGER NOT NULL
				     , spent INTEGER NOT NULL
				     );
				CREATE TABLE IF NOT EXISTS "FeeBudgetHolds"
				     ( attempt_id TEXT PRIMARY KEY
				     , epoch INTEGER NOT NULL
				     , amount INTEGER NOT NULL
				     );
				)QRY");
				tx.query(R"QRY(
				INSERT OR IGNORE INTO "FeeBudget"
				VALUES(0, :epoch, :spent);
				)QRY")
					.bind(":epoch", epoch)
					.bind(":spent", spent.to_msat())
					.execute()
					;
				auto fetch = tx.query(R"QRY(
				SELECT epoch, spent FROM "FeeBudget";
				)QRY").execute();
				for (auto& r : fetch) {
					epoch = r.get<std::uint64_t>(0);
					spent = Ln::Amount::msat(
						r.get<std::uint64_t>(1)
					);
					break;
				}
				holds.clear();
				auto fetch_holds = tx.query(R"QRY(
				SELECT attempt_id, epoch, amount
				  FROM "FeeBudgetHolds";
				)QRY").execute();
				for (auto& r : fetch_holds) {
					auto id = r.get<std::string>(0);
					auto& h = holds[id];
					h.epoch = r.get<std::uint64_t>(1);
					h.amount = Ln::Amount::msat(
						r.get<std::uint64_t>(2)
					);
				}
				tx.commit();

				return Rebal::log( bus, Debug
						 , "FeeBudgeter: "
						   "Epoch %llu, spent %s, "
						   "%zu held."
						 , (unsigned long long) epoch
						 , Util::stringify(spent)
							.c_str()
						 , holds.size()
						 );
			});
		});
	}

	std::uint64_t epoch_of(double now) const {
		if (now <= 0)
			return 0;
		return std::uint64_t(std::floor(now / config.budget_epoch));
	}

	/* Moves to the epoch `now` is in, clearing the
	 * ledger if that is a new epoch.  */
	bool roll(double now) {
		auto e = epoch_of(now);
		if (e == epoch)
			return false;
		epoch = e;
		spent = Ln::Amount::msat(0);
		return true;
	}

	/* Adds to the ledger, keeping it within the cap.  */
	Ev::Io<void> add_spent(Ln::Amount amount) {
		spent += amount;
		if (spent <= config.epoch_fee_budget)
			return Ev::lift();
		auto over = spent - config.epoch_fee_budget;
		spent = config.epoch_fee_budget;
		return Rebal::log( bus, Warn
				 , "FeeBudgeter: "
				   "Fees exceeded the epoch budget "
				   "by %s, clamped to %s."
				 , Util::stringify(over).c_str()
				 , Util::stringify(spent).c_str()
				 );
	}

	/* Write the ledger, and optionally add or remove a
	 * hold in the same transaction.  */
	Ev::Io<void> save( std::string const& add_hold = ""
			 , std::string const& del_hold = ""
			 ) {
		if (!db)
			return Ev::lift();
		return db.transact().then([ this
					  , add_hold
					  , del_hold
					  ](Sqlite3::Tx tx) {
			tx.query(R"QRY(
			UPDATE "FeeBudget"
			   SET epoch = :epoch
			     , spent = :spent
			 WHERE id = 0;
			)QRY")
				.bind(":epoch", epoch)
				.bind(":spent", spent.to_msat())
				.execute()
				;
			if (add_hold != "") {
				auto const& h = holds[add_hold];
				tx.query(R"QRY(
				INSERT OR REPLACE INTO "FeeBudgetHolds"
				VALUES(:attempt_id, :epoch, :amount);
				)QRY")
					.bind(":attempt_id", add_hold)
					.bind(":epoch", h.epoch)
					.bind(":amount", h.amount.to_msat())
					.execute()
					;
			}
			if (del_hold != "") {
				tx.query(R"QRY(
				DELETE FROM "FeeBudgetHolds"
				 WHERE attempt_id = :attempt_id;
				)QRY")
					.bind(":attempt_id", del_hold)
					.execute()
					;
			}
			tx.commit();
			return Ev::lift();
		});
	}

public:
	Impl( S::Bus& bus_
	    , Rebal::Config const& config_
	    ) : bus(bus_)
	      , config(config_)
	      , epoch(0)
	      , spent(Ln::Amount::msat(0))
	      { start(); }

	Ev::Io<Ln::Amount> authorize( Ln::Amount amount
				    , Ln::Amount route_fee
				    , double now
				    ) {
		return Ev::lift().then([this, now]() {
			if (roll(now))
				return save();
			return Ev::lift();
		}).then([this, amount, route_fee]() {
			auto ceiling = config.max_fee;
			auto by_percent = amount * (config.max_fee_percent / 100.0);
			if (by_percent < ceiling)
				ceiling = by_percent;
			auto left = remaining();
			if (left < ceiling)
				ceiling = left;

			auto required = config.min_fee;
			if (route_fee > required)
				required = route_fee;

			if (ceiling < required)
				throw NoBudgetError(
					"Fee allowance " + std::string(ceiling)
				      + " is below the required "
				      + std::string(required)
				      + " (epoch remaining "
				      + std::string(left) + ")"
				);
			return Ev::lift(ceiling);
		});
	}

	Ev::Io<void> charge(Ln::Amount fee, double now) {
		return Ev::lift().then([this, fee, now]() {
			roll(now);
			return add_spent(fee);
		}).then([this]() {
			return save();
		});
	}

	Ev::Io<void> hold( std::string const& attempt_id
			 , Ln::Amount ceiling
			 , double now
			 ) {
		return Ev::lift().then([this, attempt_id, ceiling, now]() {
			roll(now);
			auto& h = holds[attempt_id];
			h.epoch = epoch;
			h.amount = ceiling;
			return add_spent(ceiling);
		}).then([this, attempt_id]() {
			return save(attempt_id, "");
		});
	}

	Ev::Io<void> settle( std::string const& attempt_id
			   , bool succeeded
			   , Ln::Amount actual
			   , double now
			   ) {
		return Ev::lift().then([ this
				       , attempt_id
				       , succeeded
				       , actual
				       , now
				       ]() {
			roll(now);
			auto it = holds.find(attempt_id);
			if (it == holds.end()) {
				/* Nothing held, so just pay it.  */
				if (succeeded)
					return add_spent(actual);
				return Ev::lift();
			}
			auto h = it->second;
			holds.erase(it);
			if (h.epoch != epoch)
				return Rebal::log( bus, Debug
						 , "FeeBudgeter: "
						   "Hold for %s is from an "
						   "earlier epoch, dropped."
						 , attempt_id.c_str()
						 );
			spent -= h.amount;
			if (succeeded)
				return add_spent(actual);
			return Ev::lift();
		}).then([this, attempt_id]() {
			return save("", attempt_id);
		});
	}

	Ln::Amount get_spent() const { return spent; }
	Ln::Amount remaining() const {
		return config.epoch_fee_budget - spent;
	}
};

FeeBudgeter::FeeBudgeter(FeeBudgeter&&) =default;
FeeBudgeter::~FeeBudgeter() =default;

FeeBudgeter::FeeBudgeter( S::Bus& bus
			, Rebal::Config const& config
			) : pimpl(Util::make_unique<Impl>(bus, config)) { }

Ev::Io<Ln::Amount> FeeBudgeter::authorize( Ln::Amount amount
					 , Ln::Amount route_fee
					 , double now
					 ) {
	return pimpl->authorize(amount, route_fee, now);
}
Ev::Io<void> FeeBudgeter::charge(Ln::Amount fee, double now) {
	return pimpl->charge(fee, now);
}
Ev::Io<void> FeeBudgeter::hold( std::string const& attempt_id
			      , Ln::Amount ceiling
			      , double now
			      ) {
	return pimpl->hold(attempt_id, ceiling, now);
}
Ev::Io<void> FeeBudgeter::settle( std::string const& attempt_id
				, bool succeeded
				, Ln::Amount actual
				, double now
				) {
	return pimpl->settle(attempt_id, succeeded, actual, now);
}
Ln::Amount FeeBudgeter::spent() const {
	return pimpl->get_spent();
}
Ln::Amount FeeBudgeter::remaining() const {
	return pimpl->remaining();
}

}}
