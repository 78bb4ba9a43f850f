#include"Ev/Io.hpp"
#include"Rebal/Mod/AttemptHistory.hpp"
#include"Rebal/Msg/AttemptResolved.hpp"
#include"Rebal/Msg/DbResource.hpp"
#include"Rebal/RebalanceAttempt.hpp"
#include"S/Bus.hpp"
#include"Sqlite3.hpp"
#include"Util/make_unique.hpp"
#include<cstdint>

namespace {

auto const select_columns = std::string(R"QRY(
	SELECT source, destination, amount, fee_ceiling, status
	     , created, resolved, reason, attempt_id, payment_hash
	     , fee
	  FROM "RebalanceAttempts"
)QRY");

Rebal::RebalanceAttempt read_attempt(Sqlite3::Row& r) {
	auto ret = Rebal::RebalanceAttempt();
	ret.source = Ln::Scid(r.get<std::string>(0));
	ret.destination = Ln::Scid(r.get<std::string>(1));
	ret.amount = Ln::Amount::msat(r.get<std::uint64_t>(2));
	ret.fee_ceiling = Ln::Amount::msat(r.get<std::uint64_t>(3));
	ret.status = Rebal::status_from_string(r.get<std::string>(4));
	ret.created = r.get<double>(5);
	ret.resolved = r.get<double>(6);
	ret.reason = r.get<std::string>(7);
	ret.attempt_id = r.get<std::string>(8);
	ret.payment_hash = r.get<std::string>(9);
	ret.fee_known = !r.is_null(10);
	if (ret.fee_known)
		ret.fee = Ln::Amount::msat(r.get<std::uint64_t>(10));
	return ret;
}

template<typename Q>
Q& bind_attempt(Q& q, Rebal::RebalanceAttempt const& a) {
	q.bind(":source", std::string(a.source))
	 .bind(":destination", std::string(a.destination))
	 .bind(":amount", a.amount.to_msat())
	 .bind(":fee_ceiling", a.fee_ceiling.to_msat())
	 .bind(":status", std::string(Rebal::status_string(a.status)))
	 .bind(":created", a.created)
	 .bind(":resolved", a.resolved)
	 .bind(":reason", a.reason)
	 .bind(":attempt_id", a.attempt_id)
	 .bind(":payment_hash", a.payment_hash)
	 ;
	if (a.fee_known)
		q.bind(":fee", a.fee.to_msat());
	else
		q.bind(":fee", nullptr);
	return q;
}

}

namespace Rebal { namespace Mod {

class AttemptHistory::Impl {
private:
	S::Bus& bus;
	Sqlite3::Db db;

	void start() {
		bus.subscribe<Msg::DbResource
			     >([this](Msg::DbResource const& m) {
			db = m.db;
			return db.transact().then([](Sqlite3::Tx tx) {
				tx.query_execute(R"QRY(
				CREATE TABLE IF NOT EXISTS "RebalanceAttempts"
				     ( id INTEGER PRIMARY KEY AUTOINCREMENT
				     , source TEXT NOT NULL
				     , destination TEXT NOT NULL
				     , amount INTEGER NOT NULL
				     , fee_ceiling INTEGER NOT NULL
				     , status TEXT NOT NULL
				     , created REAL NOT NULL
				     , resolved REAL NOT NULL
				     , reason TEXT NOT NULL
				     , attempt_id TEXT NOT NULL
				     , payment_hash TEXT NOT NULL
				     , fee INTEGER
				     );
				CREATE INDEX IF NOT EXISTS
				       "RebalanceAttempts_attempt_id_idx"
				    ON "RebalanceAttempts"(attempt_id);
				CREATE INDEX IF NOT EXISTS
				       "RebalanceAttempts_status_idx"
				    ON "RebalanceAttempts"(status, resolved);
				)QRY");
				tx.commit();
				return Ev::lift();
			});
		});
		bus.subscribe<Msg::AttemptResolved
			     >([this](Msg::AttemptResolved const& m) {
			return record(m.attempt);
		});
	}

public:
	explicit
	Impl(S::Bus& bus_) : bus(bus_) { start(); }

	Ev::Io<void> record(RebalanceAttempt const& a) {
		if (!db)
			return Ev::lift();
		return db.transact().then([a](Sqlite3::Tx tx) {
			auto existing = false;
			if (a.attempt_id != "") {
				auto fetch = tx.query(R"QRY(
				SELECT id FROM "RebalanceAttempts"
				 WHERE attempt_id = :attempt_id;
				)QRY")
					.bind(":attempt_id", a.attempt_id)
					.execute()
					;
				for (auto& r : fetch) {
					(void) r;
					existing = true;
				}
			}
			if (existing) {
				auto q = tx.query(R"QRY(
				UPDATE "RebalanceAttempts"
				   SET source = :source
				     , destination = :destination
				     , amount = :amount
				     , fee_ceiling = :fee_ceiling
				     , status = :status
				     , created = :created
				     , resolved = :resolved
				     , reason = :reason
				     , payment_hash = :payment_hash
				     , fee = :fee
				 WHERE attempt_id = :attempt_id;
				)QRY");
				bind_attempt(q, a).execute();
			} else {
				auto q = tx.query(R"QRY(
				INSERT INTO "RebalanceAttempts"
				     ( source, destination, amount
				     , fee_ceiling, status, created
				     , resolved, reason, attempt_id
				     , payment_hash, fee
				     )
				VALUES( :source, :destination, :amount
				      , :fee_ceiling, :status, :created
				      , :resolved, :reason, :attempt_id
				      , :payment_hash, :fee
				      );
				)QRY");
				bind_attempt(q, a).execute();
			}
			tx.commit();
			return Ev::lift();
		});
	}

	Ev::Io<std::vector<RebalanceAttempt>> unresolved() {
		if (!db)
			return Ev::lift(std::vector<RebalanceAttempt>());
		return db.transact().then([](Sqlite3::Tx tx) {
			auto ret = std::vector<RebalanceAttempt>();
			auto fetch = tx.query(select_columns + R"QRY(
			 WHERE status = 'ambiguous'
			 ORDER BY id ASC;
			)QRY").execute();
			for (auto& r : fetch)
				ret.push_back(read_attempt(r));
			tx.commit();
			return Ev::lift(std::move(ret));
		});
	}

	Ev::Io<std::map<Ln::Scid, double>> last_successes() {
		typedef std::map<Ln::Scid, double> Map;
		if (!db)
			return Ev::lift(Map());
		return db.transact().then([](Sqlite3::Tx tx) {
			auto ret = Map();
			auto fetch = tx.query(R"QRY(
			SELECT source, destination, resolved
			  FROM "RebalanceAttempts"
			 WHERE status = 'succeeded';
			)QRY").execute();
			for (auto& r : fetch) {
				auto resolved = r.get<double>(2);
				for (auto c : {0, 1}) {
					auto& t = ret[Ln::Scid(r.get<std::string>(c))];
					if (t < resolved)
						t = resolved;
				}
			}
			tx.commit();
			return Ev::lift(std::move(ret));
		});
	}

	Ev::Io<std::size_t> prune(double before) {
		if (!db)
			return Ev::lift(std::size_t(0));
		return db.transact().then([before](Sqlite3::Tx tx) {
			auto count = std::size_t(0);
			auto fetch = tx.query(R"QRY(
			SELECT COUNT(*) FROM "RebalanceAttempts"
			 WHERE status IN ('succeeded', 'failed')
			   AND resolved < :before;
			)QRY")
				.bind(":before", before)
				.execute()
				;
			for (auto& r : fetch)
				count = r.get<std::size_t>(0);
			tx.query(R"QRY(
			DELETE FROM "RebalanceAttempts"
			 WHERE status IN ('succeeded', 'failed')
			   AND resolved < :before;
			)QRY")
				.bind(":before", before)
				.execute()
				;
			tx.commit();
			return Ev::lift(count);
		});
	}

	Ev::Io<std::vector<RebalanceAttempt>> recent(std::size_t limit) {
		if (!db)
			return Ev::lift(std::vector<RebalanceAttempt>());
		return db.transact().then([limit](Sqlite3::Tx tx) {
			auto ret = std::vector<RebalanceAttempt>();
			auto fetch = tx.query(select_columns + R"QRY(
			 ORDER BY id DESC
			 LIMIT :limit;
			)QRY")
				.bind(":limit", limit)
				.execute()
				;
			for (auto& r : fetch)
				ret.push_back(read_attempt(r));
			tx.commit();
			return Ev::lift(std::move(ret));
		});
	}
};

AttemptHistory::AttemptHistory(AttemptHistory&&) =default;
AttemptHistory::~AttemptHistory() =default;

AttemptHistory::AttemptHistory(S::Bus& bus)
	: pimpl(Util::make_unique<Impl>(bus)) { }

Ev::Io<void> AttemptHistory::record(RebalanceAttempt const& attempt) {
	return pimpl->record(attempt);
}
Ev::Io<std::vector<RebalanceAttempt>> AttemptHistory::unresolved() {
	return pimpl->unresolved();
}
Ev::Io<std::map<Ln::Scid, double>> AttemptHistory::last_successes() {
	return pimpl->last_successes();
}
Ev::Io<std::size_t> AttemptHistory::prune(double before) {
	return pimpl->prune(before);
}
Ev::Io<std::vector<RebalanceAttempt>>
AttemptHistory::recent(std::size_t limit) {
	return pimpl->recent(limit);
}

}}
