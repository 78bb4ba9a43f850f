#undef NDEBUG
#include"Rebal/Config.hpp"
#include<assert.h>
#include<map>
#include<sstream>
#include<string>

namespace {

bool fails(std::map<std::string, std::string> const& options) {
	try {
		(void) Rebal::parse_config(options);
		return false;
	} catch (Rebal::ConfigError const&) {
		return true;
	}
}

}

int main() {
	/* Defaults.  */
	{
		auto c = Rebal::parse_config({});
		assert(c.poll_interval == 600);
		assert(c.max_amount == Ln::Amount::sat(1000000));
		assert(c.min_amount == Ln::Amount::sat(10000));
		assert(c.ratio_low == 0.4);
		assert(c.ratio_high == 0.6);
		assert(c.max_fee == Ln::Amount::msat(1000000));
		assert(c.epoch_fee_budget == Ln::Amount::msat(10000000));
		assert(c.failure_cap == 5);
		assert(c.permanent_exclusion);
		assert(c.max_candidates == 3);
		assert(!c.allow_same_peer);
		assert(c.log_level == Rebal::Info);
	}

	/* Overrides.  */
	{
		auto c = Rebal::parse_config({
			{"poll-interval", "60"},
			{"max-amount", "500000"},
			{"ratio-low", "0.3"},
			{"ratio-high", "0.7"},
			{"max-fee-percent", "0.5"},
			{"permanent-exclusion", "false"},
			{"include-peers", "020000000000000000000000000000000000000000000000000000000000000001, 030000000000000000000000000000000000000000000000000000000000000002"},
			{"log-level", "debug"}
		});
		assert(c.poll_interval == 60);
		assert(c.max_amount == Ln::Amount::sat(500000));
		assert(c.ratio_low == 0.3);
		assert(c.ratio_high == 0.7);
		assert(c.max_fee_percent == 0.5);
		assert(!c.permanent_exclusion);
		assert(c.include_peers.size() == 2);
		assert(c.log_level == Rebal::Debug);
	}

	/* Rejections.  */
	assert(fails({{"no-such-option", "1"}}));
	assert(fails({{"poll-interval", "soon"}}));
	assert(fails({{"poll-interval", "0"}}));
	assert(fails({{"max-amount", "-5"}}));
	assert(fails({{"ratio-low", "0.6"}, {"ratio-high", "0.4"}}));
	assert(fails({{"ratio-high", "1.5"}}));
	assert(fails({{"min-amount", "2000000"}}));
	assert(fails({{"max-fee-percent", "150"}}));
	assert(fails({{"cooldown-base", "100000"}}));
	assert(fails({{"failure-cap", "0"}}));
	assert(fails({{"permanent-exclusion", "maybe"}}));
	assert(fails({{"exclude-peers", "nobody"}}));
	assert(fails({{"log-level", "loud"}}));
	/* A capped pair must never be excluded for less
	 * time than after the failure before.  */
	assert(fails({ {"permanent-exclusion", "false"}
		     , {"cap-cooldown", "60"}
		     }));
	assert(fails({ {"permanent-exclusion", "false"}
		     , {"cooldown-max", "7200"}
		     , {"cap-cooldown", "3600"}
		     }));
	{
		auto c = Rebal::parse_config({ {"permanent-exclusion", "false"}
					     , {"cooldown-max", "7200"}
					     , {"cap-cooldown", "7200"}
					     });
		assert(c.cap_cooldown == 7200);
		/* Irrelevant while capped pairs stay out for good.  */
		c = Rebal::parse_config({{"cap-cooldown", "60"}});
		assert(c.permanent_exclusion);
	}
	assert(fails({ {"include-peers", "020000000000000000000000000000000000000000000000000000000000000001"}
		     , {"exclude-peers", "020000000000000000000000000000000000000000000000000000000000000001"}
		     }));

	/* Config files.  */
	{
		auto is = std::istringstream(
			"# comment\n"
			"\n"
			"  poll-interval = 120  \n"
			"eclair-password=s3cr=t\n"
		);
		auto options = Rebal::read_config_file(is, "test.conf");
		assert(options.size() == 2);
		assert(options["poll-interval"] == "120");
		assert(options["eclair-password"] == "s3cr=t");
		auto c = Rebal::parse_config(options);
		assert(c.poll_interval == 120);
		assert(c.eclair_password == "s3cr=t");
	}
	{
		auto is = std::istringstream("poll-interval 120\n");
		auto flag = false;
		try {
			(void) Rebal::read_config_file(is, "test.conf");
		} catch (Rebal::ConfigError const& e) {
			flag = std::string(e.what()).find("test.conf:1") != std::string::npos;
		}
		assert(flag);
	}

	return 0;
}
