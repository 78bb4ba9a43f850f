#ifndef REBAL_NODEIF_HPP
#define REBAL_NODEIF_HPP

#include"Ln/Amount.hpp"
#include"Ln/Scid.hpp"
#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<stdexcept>
#include<string>
#include<vector>

namespace Ev { template<typename a> class Io; }
namespace Rebal { struct Channel; }

namespace Rebal {

struct Invoice {
	/* Serialized invoice, as the node wants it back
	 * when paying.  */
	std::string id;
	std::string payment_hash;
	Ln::Amount amount;
	/* Blocks the last hop must leave the payee, or 0
	 * if the node did not say.  */
	std::uint32_t min_final_cltv_expiry;
};

/* Mandated first and last hops of a self-payment.
 * Our own node and the two hinted channels are never
 * used as intermediate hops.  */
struct RouteHints {
	Ln::Scid source;
	Ln::Scid destination;
};

struct Route {
	/* Every channel on the path, starting with the
	 * source channel and ending with the destination
	 * channel.  */
	std::vector<Ln::Scid> channels;
	/* Fees the route is expected to cost.  */
	Ln::Amount fee;
};

struct PaymentStatus {
	enum Type {
		Pending,
		Succeeded,
		Failed
	};
	Type type;
	/* Valid if Succeeded.  */
	Ln::Amount fee;
	/* Valid if Failed.  */
	std::string reason;
};

/** class Rebal::NodeIF
 *
 * @brief interface to the payment node we
 * rebalance.
 *
 * @desc Implementations report transport trouble
 * with ConnectivityError, and answers they cannot
 * make sense of with NodeError.
 */
class NodeIF {
public:
	virtual ~NodeIF() { }

	virtual
	Ev::Io<std::vector<Rebal::Channel>> list_channels() =0;

	virtual
	Ev::Io<Rebal::Invoice> create_invoice( Ln::Amount amount
					     , std::string const& description
					     ) =0;

	/* Throws NoRouteError if the node finds no path.  */
	virtual
	Ev::Io<Rebal::Route> find_route( Rebal::RouteHints const& hints
				       , Ln::Amount amount
				       ) =0;

	/* Returns the attempt id to query the status with.
	 * Throws PaymentFailed if the node rejects the
	 * payment outright.  */
	virtual
	Ev::Io<std::string> pay_invoice( Rebal::Invoice const& invoice
				       , Ln::Amount max_fee
				       , Rebal::Route const& route
				       ) =0;

	virtual
	Ev::Io<Rebal::PaymentStatus>
	get_payment_status(std::string const& attempt_id) =0;

	/* Deletes an invoice no payment will ever settle.  */
	virtual
	Ev::Io<void> cancel_invoice(std::string const& payment_hash) =0;
};

/** Rebal::ConnectivityError
 *
 * @brief the node could not be reached, or did
 * not answer in time.
 */
class ConnectivityError : public Util::BacktraceException<std::runtime_error> {
public:
	explicit
	ConnectivityError(std::string const& e
			 ) : Util::BacktraceException<std::runtime_error>(e) { }
};

/** Rebal::NodeError
 *
 * @brief the node answered with an error, or with
 * something we could not parse.
 */
class NodeError : public Util::BacktraceException<std::runtime_error> {
public:
	explicit
	NodeError(std::string const& e
		 ) : Util::BacktraceException<std::runtime_error>(e) { }
};

class NoRouteError : public Util::BacktraceException<std::runtime_error> {
public:
	explicit
	NoRouteError(std::string const& e
		    ) : Util::BacktraceException<std::runtime_error>(e) { }
};

class PaymentFailed : public Util::BacktraceException<std::runtime_error> {
public:
	explicit
	PaymentFailed(std::string const& e
		     ) : Util::BacktraceException<std::runtime_error>(e) { }
};

}

#endif /* !defined(REBAL_NODEIF_HPP) */
