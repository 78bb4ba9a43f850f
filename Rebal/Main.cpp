#include<assert.h>
#include<fstream>
#include<map>
#include<stdexcept>
#include<string>
#include<vector>
#include"Ev/Io.hpp"
#include"Ev/ThreadPool.hpp"
#include"Ev/yield.hpp"
#include"Rebal/Config.hpp"
#include"Rebal/Eclair/Node.hpp"
#include"Rebal/Eclair/read_conf.hpp"
#include"Rebal/Main.hpp"
#include"Rebal/Mod/AttemptHistory.hpp"
#include"Rebal/Mod/BackoffController.hpp"
#include"Rebal/Mod/ChannelMonitor.hpp"
#include"Rebal/Mod/FeeBudgeter.hpp"
#include"Rebal/Mod/Logger.hpp"
#include"Rebal/Mod/PaymentExecutor.hpp"
#include"Rebal/Mod/RoutePlanner.hpp"
#include"Rebal/Mod/Scheduler.hpp"
#include"Rebal/Mod/SignalHandler.hpp"
#include"Rebal/Mod/Waiter.hpp"
#include"Rebal/Msg/Begin.hpp"
#include"Rebal/Msg/DbResource.hpp"
#include"Rebal/NodeIF.hpp"
#include"Rebal/RebalanceAttempt.hpp"
#include"Rebal/Shutdown.hpp"
#include"S/Bus.hpp"
#include"Sqlite3/Db.hpp"
#include"Util/date.hpp"
#include"Util/make_unique.hpp"

namespace {

/* How many attempts `--report` lists.  */
auto constexpr report_limit = std::size_t(100);

}

namespace Rebal {

class Main::Impl {
private:
	std::ostream& cout;
	std::ostream& cerr;

	std::string argv0;
	bool is_version;
	bool is_help;
	bool is_report;
	bool is_reset;
	std::string conf_file;
	std::map<std::string, std::string> options;
	std::string usage_error;

	Rebal::Config config;
	Sqlite3::Db db;

	std::unique_ptr<S::Bus> bus;
	std::unique_ptr<Ev::ThreadPool> threadpool;
	std::unique_ptr<Mod::Logger> logger;
	std::unique_ptr<Mod::Waiter> waiter;
	std::unique_ptr<Mod::SignalHandler> signal_handler;
	std::unique_ptr<Rebal::NodeIF> node;
	std::unique_ptr<Mod::AttemptHistory> history;
	std::unique_ptr<Mod::FeeBudgeter> budget;
	std::unique_ptr<Mod::BackoffController> backoff;
	std::unique_ptr<Mod::ChannelMonitor> monitor;
	std::unique_ptr<Mod::RoutePlanner> planner;
	std::unique_ptr<Mod::PaymentExecutor> executor;
	std::unique_ptr<Mod::Scheduler> scheduler;

	int exit_code;

	void parse_args(std::vector<std::string> const& argv) {
		for (auto i = std::size_t(1); i < argv.size(); ++i) {
			auto const& arg = argv[i];
			if (arg == "--version" || arg == "-V")
				is_version = true;
			else if (arg == "--help" || arg == "-H")
				is_help = true;
			else if (arg == "--report")
				is_report = true;
			else if (arg == "--reset-exclusions")
				is_reset = true;
			else if (arg.substr(0, 7) == "--conf=")
				conf_file = arg.substr(7);
			else if (arg.substr(0, 2) == "--"
			      && arg.find('=') != std::string::npos) {
				auto eq = arg.find('=');
				options[arg.substr(2, eq - 2)] = arg.substr(eq + 1);
			} else if (usage_error == "")
				usage_error = "Unrecognized option: " + arg;
		}
	}

	/* Throws ConfigError.  */
	void load_config() {
		auto merged = std::map<std::string, std::string>();
		if (conf_file != "") {
			auto file = std::ifstream(conf_file);
			if (!file)
				throw ConfigError("Cannot open " + conf_file);
			merged = read_config_file(file, conf_file);
		}
		/* Command line wins.  */
		for (auto const& o : options)
			merged[o.first] = o.second;
		config = parse_config(merged);

		if (config.eclair_url == "" || config.eclair_password == "") {
			auto api = Eclair::read_conf(config.eclair_dir);
			if (config.eclair_url == "")
				config.eclair_url = api.url;
			if (config.eclair_password == "")
				config.eclair_password = api.password;
		}
	}

	void build() {
		bus = Util::make_unique<S::Bus>();
		threadpool = Util::make_unique<Ev::ThreadPool>();
		logger = Util::make_unique<Mod::Logger>( cerr, *bus
						       , config.log_level
						       );
		waiter = Util::make_unique<Mod::Waiter>(*bus);
		signal_handler = Util::make_unique<Mod::SignalHandler>(*bus);
		node = Util::make_unique<Eclair::Node>( *threadpool
						      , config.eclair_url
						      , config.eclair_password
						      , config.call_timeout
						      );
		history = Util::make_unique<Mod::AttemptHistory>(*bus);
		budget = Util::make_unique<Mod::FeeBudgeter>(*bus, config);
		backoff = Util::make_unique<Mod::BackoffController>(*bus, config);
		monitor = Util::make_unique<Mod::ChannelMonitor>( *bus, *waiter
								, config, *node
								, *history
								);
		planner = Util::make_unique<Mod::RoutePlanner>( *bus, *waiter
							      , config, *node
							      );
		executor = Util::make_unique<Mod::PaymentExecutor>( *bus, *waiter
								  , config, *node
								  , *budget
								  );
		scheduler = Util::make_unique<Mod::Scheduler>( *bus, *waiter
							     , config
							     , *monitor, *planner
							     , *budget, *executor
							     , *backoff, *history
							     );
	}

	Ev::Io<void> report() {
		return history->recent(report_limit).then([this
							  ](std::vector<RebalanceAttempt> as) {
			for (auto const& a : as) {
				cout << Util::date(a.created) << " "
				     << std::string(a.source) << " -> "
				     << std::string(a.destination) << " "
				     << a.amount << " "
				     << status_string(a.status)
				     ;
				if (a.fee_known)
					cout << " fee " << a.fee;
				if (a.reason != "")
					cout << " (" << a.reason << ")";
				cout << std::endl;
			}
			return Ev::lift();
		});
	}

	Ev::Io<void> reset_exclusions() {
		return scheduler->reset_exclusions().then([this](std::size_t n) {
			cerr << argv0 << ": Cleared " << n << " exclusions."
			     << std::endl;
			return Ev::lift();
		});
	}

	/* The node must be reachable at startup.  */
	Ev::Io<void> check_node() {
		return node->list_channels().then([](std::vector<Channel>) {
			return Ev::lift(true);
		}).catching<ConnectivityError>([this](ConnectivityError const& e) {
			cerr << argv0 << ": Cannot reach Eclair at "
			     << config.eclair_url << ": " << e.what()
			     << std::endl;
			return Ev::lift(false);
		}).catching<NodeError>([this](NodeError const& e) {
			cerr << argv0 << ": Eclair at " << config.eclair_url
			     << " failed: " << e.what()
			     << std::endl;
			return Ev::lift(false);
		}).then([this](bool ok) {
			if (!ok) {
				exit_code = 1;
				return Ev::lift();
			}
			return scheduler->run();
		});
	}

public:
	Impl( std::vector<std::string> argv
	    , std::ostream& cout_
	    , std::ostream& cerr_
	    ) : cout(cout_)
	      , cerr(cerr_)
	      , is_version(false)
	      , is_help(false)
	      , is_report(false)
	      , is_reset(false)
	      , exit_code(0)
	      {
		assert(argv.size() >= 1);
		argv0 = argv[0];
		parse_args(argv);
	}

	Ev::Io<int> run() {
		if (is_version) {
			cout << "rebalancer " << PACKAGE_VERSION << std::endl;
			return Ev::lift(0);
		} else if (is_help || usage_error != "") {
			if (usage_error != "")
				cerr << argv0 << ": " << usage_error << std::endl;
			cout << "Usage: " << argv0 << " [--conf=FILE] [--key=value ...]" << std::endl
			     << std::endl
			     << "Keeps the balances of the channels of an Eclair node" << std::endl
			     << "within a target band by paying itself in circles." << std::endl
			     << std::endl
			     << "Options:" << std::endl
			     << " --version, -V       Show version." << std::endl
			     << " --help, -H          Show this help." << std::endl
			     << " --conf=FILE         Read key=value options from FILE." << std::endl
			     << " --report            List recent rebalance attempts and exit." << std::endl
			     << " --reset-exclusions  Abandon unresolved attempts, clear capped" << std::endl
			     << "                     and ambiguous exclusions, then run." << std::endl
			     << " --key=value         Set an option; overrides --conf." << std::endl
			     ;
			return Ev::lift(usage_error == "" ? 0 : 1);
		}

		try {
			load_config();
		} catch (ConfigError const& e) {
			cerr << argv0 << ": " << e.what() << std::endl;
			return Ev::lift(1);
		}

		auto dbfile = Eclair::expand_home(config.data_dir)
			    + "/rebalancer.sqlite3"
			    ;
		try {
			db = Sqlite3::Db(dbfile);
		} catch (std::runtime_error const& e) {
			cerr << argv0 << ": Cannot open " << dbfile << ": "
			     << e.what() << std::endl;
			return Ev::lift(1);
		}

		build();

		return Ev::yield().then([this]() {
			return bus->raise(Msg::Begin());
		}).then([this]() {
			return bus->raise(Msg::DbResource{db});
		}).then([this]() {
			if (is_report)
				return report();
			auto act = Ev::lift();
			if (is_reset)
				act = reset_exclusions();
			return act.then([this]() {
				return check_node();
			});
		}).catching<std::exception>([this](std::exception const& e) {
			cerr << "Uncaught exception: " << e.what() << std::endl;
			exit_code = 1;
			return Ev::lift();
		}).then([this]() {
			/* Finish.  */
			return bus->raise(Rebal::Shutdown());
		}).then([this]() {
			return Ev::lift(exit_code);
		});
	}
};

Main::Main( std::vector<std::string> argv
	  , std::ostream& cout
	  , std::ostream& cerr
	  ) : pimpl(Util::make_unique<Impl>( std::move(argv)
					   , cout
					   , cerr
					   ))
	    { }
Main::Main(Main&& o) : pimpl(std::move(o.pimpl)) { }
Main::~Main() { }

Ev::Io<int> Main::run() {
	assert(pimpl);
	return pimpl->run();
}

}
