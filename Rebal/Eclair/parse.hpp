#ifndef REBAL_ECLAIR_PARSE_HPP
#define REBAL_ECLAIR_PARSE_HPP

#include"Ln/Amount.hpp"
#include"Rebal/Channel.hpp"
#include"Rebal/NodeIF.hpp"
#include<string>
#include<vector>

namespace Jsmn { class Object; }
namespace Ln { class Scid; }

/* Conversions of Eclair API responses.
 * All of them throw Rebal::NodeError on responses
 * that do not have the expected shape.
 */
namespace Rebal { namespace Eclair {

/* `/channels`.
 * Channels without a short channel id yet are
 * left out.  */
std::vector<Rebal::Channel> parse_channels(Jsmn::Object const& js);

/* `/createinvoice`.  A missing `minFinalCltvExpiry` is
 * left as 0.  */
Rebal::Invoice parse_invoice(Jsmn::Object const& js);

/* `/findroutebetweennodes` with `format=full`.
 * Gives the channels between the two nodes and
 * what they charge to forward `amount`.
 * Throws Rebal::NoRouteError if there are no
 * routes.  */
Rebal::Route parse_route(Jsmn::Object const& js, Ln::Amount amount);

/* `/allupdates` of a node: what it charges to
 * forward `amount` over the given channel.  */
Ln::Amount parse_channel_fee( Jsmn::Object const& js
			    , Ln::Scid const& channel
			    , Ln::Amount amount
			    );

/* `/getsentinfo`: a payment is Succeeded once any
 * of its parts was sent, Failed once all of them
 * failed, and Pending otherwise.  */
Rebal::PaymentStatus parse_sent_info(Jsmn::Object const& js);

/* `/getinfo`: our own node id.  */
std::string parse_own_id(Jsmn::Object const& js);

}}

#endif /* !defined(REBAL_ECLAIR_PARSE_HPP) */
