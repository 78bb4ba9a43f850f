#ifndef REBAL_ECLAIR_NODE_HPP
#define REBAL_ECLAIR_NODE_HPP

#include"Rebal/NodeIF.hpp"
#include<memory>
#include<string>

namespace Ev { class ThreadPool; }

namespace Rebal { namespace Eclair {

/** class Rebal::Eclair::Node
 *
 * @brief talks to an Eclair node over its HTTP
 * API.
 *
 * @desc Each call is a form-encoded POST with
 * basic authentication, run on the thread pool
 * and bounded by `call_timeout` seconds.
 * Payments are identified by their payment hash.
 */
class Node : public Rebal::NodeIF {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Node() =delete;
	Node(Node const&) =delete;
	~Node();

	Node( Ev::ThreadPool& threadpool
	    , std::string url
	    , std::string password
	    , double call_timeout
	    );

	Ev::Io<std::vector<Rebal::Channel>> list_channels() override;
	Ev::Io<Rebal::Invoice> create_invoice( Ln::Amount amount
					     , std::string const& description
					     ) override;
	Ev::Io<Rebal::Route> find_route( Rebal::RouteHints const& hints
				       , Ln::Amount amount
				       ) override;
	Ev::Io<std::string> pay_invoice( Rebal::Invoice const& invoice
				       , Ln::Amount max_fee
				       , Rebal::Route const& route
				       ) override;
	Ev::Io<Rebal::PaymentStatus>
	get_payment_status(std::string const& attempt_id) override;
	Ev::Io<void> cancel_invoice(std::string const& payment_hash) override;
};

}}

#endif /* !defined(REBAL_ECLAIR_NODE_HPP) */
