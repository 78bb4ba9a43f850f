#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include"Sqlite3.hpp"
#include<assert.h>
#include<cstdint>
#include<memory>
#include<string>

int main() {
	auto db = Sqlite3::Db(":memory:");
	auto order = std::string();

	/* Transactions are serialized: a second one only
	 * starts once the first is done.  */
	auto bump = [&](char const* tag) {
		return db.transact().then([&order, tag](Sqlite3::Tx tx) {
			order += tag;
			auto ptx = std::make_shared<Sqlite3::Tx>(std::move(tx));
			return Ev::yield().then([&order, tag, ptx]() {
				order += tag;
				ptx->commit();
				return Ev::lift();
			});
		});
	};

	auto code = Ev::lift().then([&]() {
		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		assert(tx);
		tx.query_execute(R"QRY(
		CREATE TABLE "Ledger"
			( id TEXT PRIMARY KEY
			, amount INTEGER NOT NULL
			, when_ REAL NOT NULL
			, settled INTEGER NOT NULL
			, reason TEXT
			);
		)QRY");
		tx.commit();
		assert(!tx);

		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		tx.query(R"QRY(
		INSERT INTO "Ledger"
		VALUES(:id, :amount, :when, :settled, :reason);
		)QRY")
			.bind(":id", std::string("hash1"))
			.bind(":amount", (unsigned long long) 5000000000ULL)
			.bind(":when", 1700000000.5)
			.bind(":settled", true)
			.bind(":reason", nullptr)
			.execute();
		tx.query(R"QRY(
		INSERT INTO "Ledger"
		VALUES(:id, :amount, :when, :settled, :reason);
		)QRY")
			.bind(":id", "hash2")
			.bind(":amount", 12)
			.bind(":when", 1700000001.0)
			.bind(":settled", false)
			.bind(":reason", "expired")
			.execute();
		tx.commit();

		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		auto rows = tx.query(R"QRY(
		SELECT id, amount, when_, settled, reason
		  FROM "Ledger"
		 ORDER BY when_ ASC;
		)QRY").execute();
		auto count = 0;
		for (auto& r : rows) {
			if (count == 0) {
				assert(r.get<std::string>(0) == "hash1");
				assert(r.get<std::uint64_t>(1) == 5000000000ULL);
				assert(r.get<double>(2) == 1700000000.5);
				assert(r.get<bool>(3));
				assert(r.is_null(4));
			} else {
				assert(r.get<std::string>(0) == "hash2");
				assert(r.get<int>(1) == 12);
				assert(!r.get<bool>(3));
				assert(!r.is_null(4));
				assert(r.get<std::string>(4) == "expired");
			}
			++count;
		}
		assert(count == 2);
		tx.commit();

		/* Rolled back writes vanish.  */
		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		tx.query_execute(R"QRY(DELETE FROM "Ledger";)QRY");
		tx.rollback();

		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		auto rows = tx.query(R"QRY(SELECT COUNT(*) FROM "Ledger";)QRY")
			.execute();
		for (auto& r : rows)
			assert(r.get<int>(0) == 2);
		tx.commit();

		return Ev::concurrent(bump("a"))
		     + Ev::concurrent(bump("b"))
		     ;
	}).then([&]() {
		return Ev::yield() + Ev::yield() + Ev::yield() + Ev::yield();
	}).then([&]() {
		/* Wait for the last transaction to end.  */
		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		tx.commit();
		assert(order == "aabb");
		return Ev::lift(0);
	});

	return Ev::start(code);
}
