#include"Rebal/Config.hpp"
#include"Util/Str.hpp"
#include<cmath>
#include<functional>
#include<locale>
#include<sstream>

namespace {

using Rebal::ConfigError;

double parse_double(std::string const& key, std::string const& value) {
	auto is = std::istringstream(Util::Str::trim(value));
	is.imbue(std::locale("C"));
	auto ret = double(0);
	is >> ret;
	if (!is || !is.eof() || !std::isfinite(ret))
		throw ConfigError( "Option " + key
				 + ": not a number: " + value
				 );
	return ret;
}
std::uint64_t parse_uint(std::string const& key, std::string const& value) {
	auto s = Util::Str::trim(value);
	if (s.empty())
		throw ConfigError("Option " + key + ": empty value");
	auto ret = std::uint64_t(0);
	for (auto c : s) {
		if (c < '0' || c > '9')
			throw ConfigError( "Option " + key
					 + ": not a non-negative integer: "
					 + value
					 );
		auto next = ret * 10 + std::uint64_t(c - '0');
		if (next / 10 != ret)
			throw ConfigError("Option " + key + ": too large");
		ret = next;
	}
	return ret;
}
bool parse_bool(std::string const& key, std::string const& value) {
	auto s = Util::Str::trim(value);
	if (s == "true" || s == "1" || s == "yes")
		return true;
	if (s == "false" || s == "0" || s == "no")
		return false;
	throw ConfigError("Option " + key + ": not a boolean: " + value);
}
double parse_seconds(std::string const& key, std::string const& value) {
	auto ret = parse_double(key, value);
	if (ret <= 0)
		throw ConfigError("Option " + key + ": must be positive");
	return ret;
}
std::set<Ln::NodeId> parse_peers(std::string const& key, std::string const& value) {
	auto ret = std::set<Ln::NodeId>();
	for (auto const& piece : Util::Str::split(value, ',')) {
		auto s = Util::Str::trim(piece);
		if (s.empty())
			continue;
		if (!Ln::NodeId::valid_string(s))
			throw ConfigError("Option " + key + ": not a node id: " + s);
		ret.insert(Ln::NodeId(s));
	}
	return ret;
}
Rebal::LogLevel parse_level(std::string const& key, std::string const& value) {
	auto s = Util::Str::trim(value);
	for (auto l : { Rebal::Trace, Rebal::Debug, Rebal::Info
		      , Rebal::Warn, Rebal::Error
		      }) {
		if (s == Rebal::log_level_string(l))
			return l;
	}
	throw ConfigError("Option " + key + ": unknown log level: " + value);
}

typedef std::function<void(Rebal::Config&, std::string const&, std::string const&)> Setter;

std::map<std::string, Setter> const& setters() {
	static auto const table = std::map<std::string, Setter>{
	{ "eclair-url", [](Rebal::Config& c, std::string const&, std::string const& v) {
		c.eclair_url = Util::Str::trim(v);
	} },
	{ "eclair-password", [](Rebal::Config& c, std::string const&, std::string const& v) {
		c.eclair_password = v;
	} },
	{ "eclair-dir", [](Rebal::Config& c, std::string const&, std::string const& v) {
		c.eclair_dir = Util::Str::trim(v);
	} },
	{ "data-dir", [](Rebal::Config& c, std::string const&, std::string const& v) {
		c.data_dir = Util::Str::trim(v);
	} },
	{ "poll-interval", [](Rebal::Config& c, std::string const& k, std::string const& v) {
		c.poll_interval = parse_seconds(k, v);
	} },
	{ "max-amount", [](Rebal::Config& c, std::string const& k, std::string const& v) {
		c.max_amount = Ln::Amount::sat(parse_uint(k, v));
	} },
	{ "min-amount", [](Rebal::Config& c, std::string const& k, std::string const& v) {
		c.min_amount = Ln::Amount::sat(parse_uint(k, v));
	} },
	{ "reserve-margin", [](Rebal::Config& c, std::string const& k, std::string const& v) {
		c.reserve_margin = Ln::Amount::sat(parse_uint(k, v));
	} },
	{ "ratio-low", [](Rebal::Config& c, std::string const& k, std::string const& v) {
		c.ratio_low = parse_double(k, v);
	} },
	{ "ratio-high", [](Rebal::Config& c, std::string const& k, std::string const& v) {
		c.ratio_high = parse_double(k, v);
	} },
	{ "max-fee", [](Rebal::Config& c, std::string const& k, std::string const& v) {
		c.max_fee = Ln::Amount::msat(parse_uint(k, v));
	} },
	{ "max-fee-percent", [](Rebal::Config& c, std::string const& k, std::string const& v) {
		c.max_fee_percent = parse_double(k, v);
	} },
	{ "epoch-fee-budget", [](Rebal::Config& c, std::string const& k, std::string const& v) {
		c.epoch_fee_budget = Ln::Amount::msat(parse_uint(k, v));
	} },
	{ "budget-epoch", [](Rebal::Config& c, std::string const& k, std::string const& v) {
		c.budget_epoch = parse_seconds(k, v);
	} },
	{ "min-fee", [](Rebal::Config& c, std::string const& k, std::string const& v) {
		c.min_fee = Ln::Amount::msat(parse_uint(k, v));
	} },
	{ "cooldown-base", [](Rebal::Config& c, std::string const& k, std::string const& v) {
		c.cooldown_base = parse_seconds(k, v);
	} },
	{ "cooldown-max", [](Rebal::Config& c, std::string const& k, std::string const& v) {
		c.cooldown_max = parse_seconds(k, v);
	} },
	{ "success-cooldown", [](Rebal::Config& c, std::string const& k, std::string const& v) {
		c.success_cooldown = parse_double(k, v);
		if (c.success_cooldown < 0)
			throw ConfigError("Option " + k + ": must not be negative");
	} },
	{ "failure-cap", [](Rebal::Config& c, std::string const& k, std::string const& v) {
		c.failure_cap = parse_uint(k, v);
	} },
	{ "permanent-exclusion", [](Rebal::Config& c, std::string const& k, std::string const& v) {
		c.permanent_exclusion = parse_bool(k, v);
	} },
	{ "cap-cooldown", [](Rebal::Config& c, std::string const& k, std::string const& v) {
		c.cap_cooldown = parse_seconds(k, v);
	} },
	{ "max-candidates", [](Rebal::Config& c, std::string const& k, std::string const& v) {
		c.max_candidates = parse_uint(k, v);
	} },
	{ "include-peers", [](Rebal::Config& c, std::string const& k, std::string const& v) {
		c.include_peers = parse_peers(k, v);
	} },
	{ "exclude-peers", [](Rebal::Config& c, std::string const& k, std::string const& v) {
		c.exclude_peers = parse_peers(k, v);
	} },
	{ "allow-same-peer", [](Rebal::Config& c, std::string const& k, std::string const& v) {
		c.allow_same_peer = parse_bool(k, v);
	} },
	{ "call-timeout", [](Rebal::Config& c, std::string const& k, std::string const& v) {
		c.call_timeout = parse_seconds(k, v);
	} },
	{ "status-poll-interval", [](Rebal::Config& c, std::string const& k, std::string const& v) {
		c.status_poll_interval = parse_seconds(k, v);
	} },
	{ "status-poll-timeout", [](Rebal::Config& c, std::string const& k, std::string const& v) {
		c.status_poll_timeout = parse_seconds(k, v);
	} },
	{ "reconcile-attempts", [](Rebal::Config& c, std::string const& k, std::string const& v) {
		c.reconcile_attempts = parse_uint(k, v);
	} },
	{ "reconcile-interval", [](Rebal::Config& c, std::string const& k, std::string const& v) {
		c.reconcile_interval = parse_seconds(k, v);
	} },
	{ "log-level", [](Rebal::Config& c, std::string const& k, std::string const& v) {
		c.log_level = parse_level(k, v);
	} }
	};
	return table;
}

void validate(Rebal::Config const& c) {
	if (c.ratio_low < 0 || c.ratio_high > 1 || !(c.ratio_low < c.ratio_high))
		throw ConfigError( "ratio-low and ratio-high must satisfy "
				   "0 <= ratio-low < ratio-high <= 1"
				 );
	if (c.min_amount == Ln::Amount::msat(0))
		throw ConfigError("min-amount must be positive");
	if (c.min_amount > c.max_amount)
		throw ConfigError("min-amount must not exceed max-amount");
	if (c.max_fee_percent < 0 || c.max_fee_percent > 100)
		throw ConfigError("max-fee-percent must be within 0 to 100");
	if (c.cooldown_base > c.cooldown_max)
		throw ConfigError("cooldown-base must not exceed cooldown-max");
	/* The exclusion at the cap must not be shorter
	 * than the one before it.  */
	if (!c.permanent_exclusion && c.cap_cooldown < c.cooldown_max)
		throw ConfigError( "cap-cooldown must not be less than "
				   "cooldown-max when permanent-exclusion "
				   "is off"
				 );
	if (c.failure_cap == 0)
		throw ConfigError("failure-cap must be positive");
	if (c.max_candidates == 0)
		throw ConfigError("max-candidates must be positive");
	for (auto const& p : c.include_peers)
		if (c.exclude_peers.count(p) != 0)
			throw ConfigError( "Peer " + std::string(p)
					 + " is both included and excluded"
					 );
}

}

namespace Rebal {

Config parse_config(std::map<std::string, std::string> const& options) {
	auto ret = Config();
	auto const& table = setters();
	for (auto const& o : options) {
		auto it = table.find(o.first);
		if (it == table.end())
			throw ConfigError("Unknown option: " + o.first);
		it->second(ret, o.first, o.second);
	}
	validate(ret);
	return ret;
}

std::map<std::string, std::string>
read_config_file(std::istream& is, std::string const& source) {
	auto ret = std::map<std::string, std::string>();
	auto line = std::string();
	auto lineno = std::size_t(0);
	while (std::getline(is, line)) {
		++lineno;
		auto l = Util::Str::trim(line);
		if (l.empty() || l[0] == '#')
			continue;
		auto eq = l.find('=');
		if (eq == std::string::npos || eq == 0)
			throw ConfigError( source + ":" + std::to_string(lineno)
					 + ": expected key=value"
					 );
		ret[Util::Str::trim(l.substr(0, eq))] = Util::Str::trim(l.substr(eq + 1));
	}
	return ret;
}

}
