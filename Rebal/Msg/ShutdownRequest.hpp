#ifndef REBAL_MSG_SHUTDOWNREQUEST_HPP
#define REBAL_MSG_SHUTDOWNREQUEST_HPP

namespace Rebal { namespace Msg {

/** struct Rebal::Msg::ShutdownRequest
 *
 * @brief the operator asked us to stop (SIGINT or
 * SIGTERM).
 *
 * @desc Unlike `Rebal::Shutdown`, this does not
 * cancel anything: the scheduler finishes the
 * attempt in flight and then stops.
 */
struct ShutdownRequest {
	int signum;
};

}}

#endif /* !defined(REBAL_MSG_SHUTDOWNREQUEST_HPP) */
