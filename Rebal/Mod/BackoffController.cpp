#include"Ev/Io.hpp"
#include"Ln/Scid.hpp"
#include"Rebal/Config.hpp"
#include"Rebal/Mod/BackoffController.hpp"
#include"Rebal/Msg/DbResource.hpp"
#include"Rebal/log.hpp"
#include"S/Bus.hpp"
#include"Sqlite3.hpp"
#include"Util/make_unique.hpp"
#include<map>
#include<set>
#include<utility>
#include<vector>

namespace Rebal { namespace Mod {

class BackoffController::Impl {
private:
	S::Bus& bus;
	Rebal::Config const& config;

	Sqlite3::Db db;

	typedef std::pair<Ln::Scid, Ln::Scid> Pair;
	struct Entry {
		std::size_t failures;
		/* Seconds since epoch.  */
		double expiry;
		bool permanent;
		/* Waiting on an attempt whose outcome is
		 * unknown.  */
		bool ambiguous;
		std::string reason;
	};
	std::map<Pair, Entry> entries;
	std::set<Pair> attempting;

	void start() {
		bus.subscribe<Msg::DbResource
			     >([this](Msg::DbResource const& m) {
			db = m.db;
			return db.transact().then([this](Sqlite3::Tx tx) {
				tx.query_execute(R"QRY(
				CREATE TABLE IF NOT EXISTS "Exclusions"
				     ( source TEXT NOT NULL
				     , destination TEXT NOT NULL
				     , failures INTEGER NOT NULL
				     , expiry REAL NOT NULL
				     , permanent INTEGER NOT NULL
				     , ambiguous INTEGER NOT NULL
				     , reason TEXT NOT NULL
				     , PRIMARY KEY (source, destination)
				     );
				)QRY");
				entries.clear();
				auto fetch = tx.query(R"QRY(
				SELECT source, destination, failures, expiry
				     , permanent, ambiguous, reason
				  FROM "Exclusions";
				)QRY").execute();
				for (auto& r : fetch) {
					auto key = Pair(
						Ln::Scid(r.get<std::string>(0)),
						Ln::Scid(r.get<std::string>(1))
					);
					auto& e = entries[key];
					e.failures = r.get<std::size_t>(2);
					e.expiry = r.get<double>(3);
					e.permanent = r.get<bool>(4);
					e.ambiguous = r.get<bool>(5);
					e.reason = r.get<std::string>(6);
				}
				tx.commit();

				return Rebal::log( bus, Debug
						 , "BackoffController: "
						   "Loaded %zu exclusions."
						 , entries.size()
						 );
			});
		});
	}

	Ev::Io<void> save(Pair const& key) {
		if (!db)
			return Ev::lift();
		return db.transact().then([this, key](Sqlite3::Tx tx) {
			auto it = entries.find(key);
			if (it == entries.end()) {
				tx.query(R"QRY(
				DELETE FROM "Exclusions"
				 WHERE source = :source
				   AND destination = :destination;
				)QRY")
					.bind(":source", std::string(key.first))
					.bind(":destination", std::string(key.second))
					.execute()
					;
			} else {
				auto const& e = it->second;
				tx.query(R"QRY(
				INSERT OR REPLACE INTO "Exclusions"
				VALUES( :source, :destination, :failures
				      , :expiry, :permanent, :ambiguous
				      , :reason
				      );
				)QRY")
					.bind(":source", std::string(key.first))
					.bind(":destination", std::string(key.second))
					.bind(":failures", e.failures)
					.bind(":expiry", e.expiry)
					.bind(":permanent", e.permanent)
					.bind(":ambiguous", e.ambiguous)
					.bind(":reason", e.reason)
					.execute()
					;
			}
			tx.commit();
			return Ev::lift();
		});
	}

	static
	std::string pair_string(Pair const& key) {
		return std::string(key.first) + "->" + std::string(key.second);
	}

public:
	Impl( S::Bus& bus_
	    , Rebal::Config const& config_
	    ) : bus(bus_), config(config_) { start(); }

	bool is_excluded(Pair const& key, double now) const {
		auto it = entries.find(key);
		if (it == entries.end())
			return false;
		auto const& e = it->second;
		return e.permanent || e.expiry > now;
	}

	void mark_attempting(Pair const& key) {
		attempting.insert(key);
	}
	void release_attempt(Pair const& key) {
		attempting.erase(key);
	}
	bool is_attempting(Pair const& key) const {
		return attempting.count(key) != 0;
	}

	Ev::Io<void> record_success(Pair const& key, double now) {
		return Ev::lift().then([this, key, now]() {
			attempting.erase(key);
			auto& e = entries[key];
			e.failures = 0;
			e.expiry = now + config.success_cooldown;
			e.permanent = false;
			e.ambiguous = false;
			e.reason = "";
			return save(key);
		});
	}

	Ev::Io<void> record_failure( Pair const& key
				   , std::string const& reason
				   , double now
				   ) {
		return Ev::lift().then([this, key, reason, now]() {
			attempting.erase(key);
			auto it = entries.find(key);
			if (it == entries.end()) {
				it = entries.emplace(key, Entry{
					0, 0, false, false, ""
				}).first;
			}
			auto& e = it->second;
			++e.failures;
			e.ambiguous = false;
			e.reason = reason;
			e.permanent = false;
			if (e.failures >= config.failure_cap) {
				if (config.permanent_exclusion)
					e.permanent = true;
				else
					e.expiry = now + config.cap_cooldown;
			} else {
				e.expiry = now + cooldown( e.failures
							 , config.cooldown_base
							 , config.cooldown_max
							 );
			}
			auto act = Ev::lift();
			if (e.permanent)
				act = Rebal::log( bus, Warn
						, "BackoffController: "
						  "%s permanently excluded "
						  "after %zu failures: %s"
						, pair_string(key).c_str()
						, e.failures
						, reason.c_str()
						);
			else
				act = Rebal::log( bus, Info
						, "BackoffController: "
						  "%s excluded for %.0f "
						  "seconds after %zu "
						  "failures: %s"
						, pair_string(key).c_str()
						, e.expiry - now
						, e.failures
						, reason.c_str()
						);
			return act + save(key);
		});
	}

	Ev::Io<void> record_ambiguous(Pair const& key, double now) {
		return Ev::lift().then([this, key, now]() {
			attempting.erase(key);
			auto it = entries.find(key);
			if (it == entries.end()) {
				it = entries.emplace(key, Entry{
					0, now, false, false, ""
				}).first;
			}
			auto& e = it->second;
			e.permanent = true;
			e.ambiguous = true;
			e.reason = "ambiguous";
			return Rebal::log( bus, Warn
					 , "BackoffController: "
					   "%s excluded until its last "
					   "attempt is resolved."
					 , pair_string(key).c_str()
					 )
			     + save(key);
		});
	}

	Ev::Io<std::size_t> reset_permanent() {
		return Ev::lift().then([this]() {
			auto cleared = std::vector<Pair>();
			for (auto const& e : entries) {
				if (e.second.permanent
				 || e.second.failures >= config.failure_cap)
					cleared.push_back(e.first);
			}
			for (auto const& key : cleared)
				entries.erase(key);

			auto act = Ev::lift();
			for (auto const& key : cleared)
				act = act + save(key);
			auto count = cleared.size();
			return act.then([this, count]() {
				return Rebal::log( bus, Info
						 , "BackoffController: "
						   "Cleared %zu capped or "
						   "ambiguous exclusions."
						 , count
						 );
			}).then([count]() {
				return Ev::lift(count);
			});
		});
	}

	std::size_t failures(Pair const& key) const {
		auto it = entries.find(key);
		if (it == entries.end())
			return 0;
		return it->second.failures;
	}
	bool is_permanent(Pair const& key) const {
		auto it = entries.find(key);
		if (it == entries.end())
			return false;
		return it->second.permanent;
	}
};

BackoffController::BackoffController(BackoffController&&) =default;
BackoffController::~BackoffController() =default;

BackoffController::BackoffController( S::Bus& bus
				    , Rebal::Config const& config
				    ) : pimpl(Util::make_unique<Impl>(bus, config)) { }

bool BackoffController::is_excluded( Ln::Scid const& source
				   , Ln::Scid const& destination
				   , double now
				   ) const {
	return pimpl->is_excluded(std::make_pair(source, destination), now);
}
void BackoffController::mark_attempting( Ln::Scid const& source
				       , Ln::Scid const& destination
				       ) {
	pimpl->mark_attempting(std::make_pair(source, destination));
}
void BackoffController::release_attempt( Ln::Scid const& source
				       , Ln::Scid const& destination
				       ) {
	pimpl->release_attempt(std::make_pair(source, destination));
}
Ev::Io<void>
BackoffController::record_success( Ln::Scid const& source
				 , Ln::Scid const& destination
				 , double now
				 ) {
	return pimpl->record_success(std::make_pair(source, destination), now);
}
Ev::Io<void>
BackoffController::record_failure( Ln::Scid const& source
				 , Ln::Scid const& destination
				 , std::string const& reason
				 , double now
				 ) {
	return pimpl->record_failure( std::make_pair(source, destination)
				    , reason, now
				    );
}
Ev::Io<void>
BackoffController::record_ambiguous( Ln::Scid const& source
				   , Ln::Scid const& destination
				   , double now
				   ) {
	return pimpl->record_ambiguous(std::make_pair(source, destination), now);
}
Ev::Io<std::size_t> BackoffController::reset_permanent() {
	return pimpl->reset_permanent();
}
std::size_t BackoffController::failures( Ln::Scid const& source
				       , Ln::Scid const& destination
				       ) const {
	return pimpl->failures(std::make_pair(source, destination));
}
bool BackoffController::is_permanent( Ln::Scid const& source
				    , Ln::Scid const& destination
				    ) const {
	return pimpl->is_permanent(std::make_pair(source, destination));
}
bool BackoffController::is_attempting( Ln::Scid const& source
				     , Ln::Scid const& destination
				     ) const {
	return pimpl->is_attempting(std::make_pair(source, destination));
}

double BackoffController::cooldown(std::size_t n, double base, double max) {
	auto ret = base;
	for (auto i = std::size_t(0); i < n && ret < max; ++i)
		ret *= 2;
	return (ret < max) ? ret : max;
}

}}
