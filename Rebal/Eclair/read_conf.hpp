#ifndef REBAL_ECLAIR_READ_CONF_HPP
#define REBAL_ECLAIR_READ_CONF_HPP

#include<istream>
#include<string>

namespace Rebal { namespace Eclair {

/* Where and how to reach the Eclair API.  */
struct ApiConf {
	std::string url;
	std::string password;
};

/** Rebal::Eclair::parse_conf
 *
 * @brief extracts `eclair.api.binding-ip`,
 * `eclair.api.port` and `eclair.api.password`
 * from the contents of an `eclair.conf`.
 * Missing settings get Eclair's defaults.
 */
ApiConf parse_conf(std::istream& is);

/** Rebal::Eclair::read_conf
 *
 * @brief reads `eclair.conf` from the given Eclair
 * directory, expanding a leading `~`.
 * Returns the defaults if the file does not exist.
 */
ApiConf read_conf(std::string const& eclair_dir);

/* Replaces a leading `~` with $HOME.  */
std::string expand_home(std::string const& path);

}}

#endif /* !defined(REBAL_ECLAIR_READ_CONF_HPP) */
