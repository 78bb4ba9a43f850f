#ifndef REBAL_CONFIG_HPP
#define REBAL_CONFIG_HPP

#include"Ln/Amount.hpp"
#include"Ln/NodeId.hpp"
#include"Rebal/log.hpp"
#include"Util/BacktraceException.hpp"
#include<cstddef>
#include<istream>
#include<map>
#include<set>
#include<stdexcept>
#include<string>

namespace Rebal {

/** Rebal::ConfigError
 *
 * @brief thrown on an unknown option, or an option
 * whose value is unparseable or inconsistent with
 * the other options.
 */
class ConfigError : public Util::BacktraceException<std::runtime_error> {
public:
	explicit
	ConfigError(std::string const& e
		   ) : Util::BacktraceException<std::runtime_error>(e) { }
};

/** struct Rebal::Config
 *
 * @brief validated runtime settings.
 *
 * @desc Parsed once at startup and then passed by
 * reference to every module that needs it.
 * Times are in seconds.
 */
struct Config {
	/* Empty means derive from eclair.conf.  */
	std::string eclair_url = "";
	std::string eclair_password = "";
	std::string eclair_dir = "~/.eclair";
	std::string data_dir = ".";

	double poll_interval = 600;

	/* Amount planning.  */
	Ln::Amount max_amount = Ln::Amount::sat(1000000);
	Ln::Amount min_amount = Ln::Amount::sat(10000);
	Ln::Amount reserve_margin = Ln::Amount::sat(0);
	double ratio_low = 0.4;
	double ratio_high = 0.6;

	/* Fee budget.  */
	Ln::Amount max_fee = Ln::Amount::msat(1000000);
	/* Percent of the rebalanced amount.  */
	double max_fee_percent = 0.1;
	Ln::Amount epoch_fee_budget = Ln::Amount::msat(10000000);
	double budget_epoch = 86400;
	Ln::Amount min_fee = Ln::Amount::msat(1000);

	/* Backoff.  */
	double cooldown_base = 600;
	double cooldown_max = 86400;
	double success_cooldown = 1800;
	std::size_t failure_cap = 5;
	bool permanent_exclusion = true;
	double cap_cooldown = 604800;

	/* Selection.  */
	std::size_t max_candidates = 3;
	std::set<Ln::NodeId> include_peers;
	std::set<Ln::NodeId> exclude_peers;
	bool allow_same_peer = false;

	/* Payment execution.  */
	double call_timeout = 30;
	double status_poll_interval = 2;
	double status_poll_timeout = 120;
	std::size_t reconcile_attempts = 5;
	double reconcile_interval = 30;

	LogLevel log_level = Info;
};

/** Rebal::parse_config
 *
 * @brief builds a Config from `key` -> `value`
 * options, with defaults for missing keys.
 * Throws ConfigError.
 */
Config parse_config(std::map<std::string, std::string> const& options);

/** Rebal::read_config_file
 *
 * @brief reads `key=value` lines.
 * Blank lines and lines starting with `#` are
 * ignored.
 * Throws ConfigError on malformed lines, naming
 * the given source and the line number.
 */
std::map<std::string, std::string>
read_config_file(std::istream& is, std::string const& source);

}

#endif /* !defined(REBAL_CONFIG_HPP) */
