#include"Rebal/Eclair/read_conf.hpp"
#include"Util/Str.hpp"
#include<cstdlib>
#include<fstream>
#include<sstream>

namespace {

auto const default_ip = std::string("127.0.0.1");
auto const default_port = std::string("8080");

std::string unquote(std::string s) {
	if ( s.size() >= 2
	  && s.front() == '"'
	  && s.back() == '"'
	   )
		return s.substr(1, s.size() - 2);
	return s;
}

}

namespace Rebal { namespace Eclair {

ApiConf parse_conf(std::istream& is) {
	auto ip = default_ip;
	auto port = default_port;
	auto password = std::string();

	auto line = std::string();
	while (std::getline(is, line)) {
		auto l = Util::Str::trim(line);
		if (l.empty() || l[0] == '#')
			continue;
		/* HOCON accepts either separator.  */
		auto sep = l.find_first_of("=:");
		if (sep == std::string::npos)
			continue;
		auto key = Util::Str::trim(l.substr(0, sep));
		auto value = unquote(Util::Str::trim(l.substr(sep + 1)));
		if (key == "eclair.api.binding-ip")
			ip = value;
		else if (key == "eclair.api.port")
			port = value;
		else if (key == "eclair.api.password")
			password = value;
	}

	auto ret = ApiConf();
	ret.url = "http://" + ip + ":" + port;
	ret.password = std::move(password);
	return ret;
}

ApiConf read_conf(std::string const& eclair_dir) {
	auto file = std::ifstream(expand_home(eclair_dir) + "/eclair.conf");
	if (!file) {
		auto is = std::istringstream("");
		return parse_conf(is);
	}
	return parse_conf(file);
}

std::string expand_home(std::string const& path) {
	if (path.empty() || path[0] != '~')
		return path;
	auto home = std::getenv("HOME");
	if (!home)
		return path;
	return std::string(home) + path.substr(1);
}

}}
