#include"Jsmn/Object.hpp"
#include"Ln/NodeId.hpp"
#include"Ln/Scid.hpp"
#include"Rebal/Eclair/parse.hpp"
#include"Util/Str.hpp"
#include<stdexcept>

namespace {

using Rebal::NodeError;

/* Null if `o` is not an object or lacks the key.  */
Jsmn::Object get(Jsmn::Object const& o, char const* key) {
	if (!o.is_object())
		return Jsmn::Object();
	return o[key];
}
/* Null if `o` is not an array or too short.  */
Jsmn::Object at(Jsmn::Object const& o, std::size_t i) {
	if (!o.is_array())
		return Jsmn::Object();
	return o[i];
}

std::string need_string(Jsmn::Object const& o, char const* what) {
	if (!o.is_string())
		throw NodeError(std::string("Eclair: expected string ") + what);
	return std::string(o);
}
Ln::Amount need_amount(Jsmn::Object const& o, char const* what) {
	if (!Ln::Amount::valid_object(o))
		throw NodeError(std::string("Eclair: expected amount ") + what);
	return Ln::Amount::object(o);
}
double need_number(Jsmn::Object const& o, char const* what) {
	if (!o.is_number())
		throw NodeError(std::string("Eclair: expected number ") + what);
	return double(o);
}

/* Eclair has moved the short channel id around
 * between versions.  */
std::string find_scid(Jsmn::Object const& data) {
	auto upd = get(get(data, "channelUpdate"), "shortChannelId");
	if (upd.is_string())
		return std::string(upd);
	auto real = get(get(get(data, "shortIds"), "real"), "realScid");
	if (real.is_string())
		return std::string(real);
	auto old = get(data, "shortChannelId");
	if (old.is_string())
		return std::string(old);
	return "";
}

Rebal::Channel parse_channel(Jsmn::Object const& js) {
	auto ret = Rebal::Channel();

	auto node_id = need_string(get(js, "nodeId"), "nodeId");
	if (!Ln::NodeId::valid_string(node_id))
		throw NodeError("Eclair: invalid nodeId " + node_id);
	ret.peer = Ln::NodeId(node_id);
	ret.active = need_string(get(js, "state"), "state") == "NORMAL";

	auto data = get(js, "data");
	auto scid = find_scid(data);
	ret.id = Ln::Scid(scid);

	auto commitments = get(data, "commitments");
	auto commitment = commitments;
	if (get(commitments, "localCommit").is_null())
		commitment = at(get(commitments, "active"), 0);
	auto spec = get(get(commitment, "localCommit"), "spec");
	ret.local = need_amount(get(spec, "toLocal"), "toLocal");
	ret.remote = need_amount(get(spec, "toRemote"), "toRemote");

	auto funding = get(get(commitment, "commitInput"), "amountSatoshis");
	if (funding.is_null())
		funding = get(get(commitment, "fundingTx"), "amountSatoshis");
	if (funding.is_number())
		ret.capacity = Ln::Amount::sat(std::uint64_t(
			need_number(funding, "amountSatoshis")
		));
	else
		ret.capacity = ret.local + ret.remote;

	ret.last_success = 0;
	return ret;
}

}

namespace Rebal { namespace Eclair {

std::vector<Rebal::Channel> parse_channels(Jsmn::Object const& js) {
	if (!js.is_array())
		throw NodeError("Eclair: channels is not an array");
	auto ret = std::vector<Rebal::Channel>();
	try {
		for (auto c : js) {
			if (find_scid(get(c, "data")) == "")
				continue;
			ret.push_back(parse_channel(c));
		}
	} catch (std::invalid_argument const& e) {
		throw NodeError(std::string("Eclair: channels: ") + e.what());
	}
	return ret;
}

Rebal::Invoice parse_invoice(Jsmn::Object const& js) {
	auto ret = Rebal::Invoice();
	try {
		ret.id = need_string(get(js, "serialized"), "serialized");
		ret.payment_hash = need_string( get(js, "paymentHash")
					      , "paymentHash"
					      );
		auto amount = get(js, "amount");
		if (amount.is_null())
			amount = get(js, "amountMsat");
		ret.amount = need_amount(amount, "amount");
		auto cltv = get(js, "minFinalCltvExpiry");
		ret.min_final_cltv_expiry = cltv.is_null()
			? std::uint32_t(0)
			: std::uint32_t(need_number(cltv, "minFinalCltvExpiry"))
			;
	} catch (std::invalid_argument const& e) {
		throw NodeError(std::string("Eclair: invoice: ") + e.what());
	}
	return ret;
}

Rebal::Route parse_route(Jsmn::Object const& js, Ln::Amount amount) {
	auto routes = get(js, "routes");
	if (routes.is_null())
		routes = js;
	if (!routes.is_array())
		throw NodeError("Eclair: routes is not an array");
	if (routes.size() == 0)
		throw NoRouteError("Eclair: no route found");

	auto ret = Rebal::Route();
	ret.fee = Ln::Amount::msat(0);
	try {
		auto hops = get(at(routes, 0), "hops");
		if (!hops.is_array() || hops.size() == 0)
			throw NoRouteError("Eclair: route has no hops");
		for (auto hop : hops) {
			auto upd = get(hop, "lastUpdate");
			auto scid = need_string( get(upd, "shortChannelId")
					       , "shortChannelId"
					       );
			if (!Ln::Scid::valid_string(scid))
				throw NodeError("Eclair: invalid shortChannelId " + scid);
			auto base = need_number(get(upd, "feeBaseMsat"), "feeBaseMsat");
			auto ppm = need_number( get(upd, "feeProportionalMillionths")
					      , "feeProportionalMillionths"
					      );
			ret.channels.push_back(Ln::Scid(scid));
			ret.fee += Ln::Amount::msat(std::uint64_t(base))
				 + amount * (ppm / 1000000.0)
				 ;
		}
	} catch (std::invalid_argument const& e) {
		throw NodeError(std::string("Eclair: route: ") + e.what());
	}
	return ret;
}

Ln::Amount parse_channel_fee( Jsmn::Object const& js
			    , Ln::Scid const& channel
			    , Ln::Amount amount
			    ) {
	if (!js.is_array())
		throw NodeError("Eclair: allupdates is not an array");
	auto scid = std::string(channel);
	for (auto upd : js) {
		auto id = get(upd, "shortChannelId");
		if (!id.is_string() || std::string(id) != scid)
			continue;
		auto base = need_number(get(upd, "feeBaseMsat"), "feeBaseMsat");
		auto ppm = need_number( get(upd, "feeProportionalMillionths")
				      , "feeProportionalMillionths"
				      );
		return Ln::Amount::msat(std::uint64_t(base))
		     + amount * (ppm / 1000000.0)
		     ;
	}
	throw NodeError("Eclair: no channel update for " + scid);
}

Rebal::PaymentStatus parse_sent_info(Jsmn::Object const& js) {
	if (!js.is_array())
		throw NodeError("Eclair: sent info is not an array");

	auto ret = Rebal::PaymentStatus();
	ret.type = PaymentStatus::Pending;
	ret.fee = Ln::Amount::msat(0);

	auto sent = false;
	auto pending = false;
	auto reasons = std::vector<std::string>();
	try {
		for (auto part : js) {
			auto status = get(part, "status");
			auto type = need_string(get(status, "type"), "status.type");
			if (type == "sent") {
				sent = true;
				auto fees = get(status, "feesPaid");
				if (!fees.is_null())
					ret.fee += need_amount(fees, "feesPaid");
			} else if (type == "failed") {
				auto failures = get(status, "failures");
				if (!failures.is_array())
					continue;
				for (auto f : failures) {
					auto msg = get(f, "failureMessage");
					if (msg.is_null())
						msg = get(f, "t");
					if (msg.is_string())
						reasons.push_back(std::string(msg));
				}
			} else
				pending = true;
		}
	} catch (std::invalid_argument const& e) {
		throw NodeError(std::string("Eclair: sent info: ") + e.what());
	}

	if (sent) {
		ret.type = PaymentStatus::Succeeded;
	} else if (!pending && js.size() != 0) {
		ret.type = PaymentStatus::Failed;
		ret.reason = reasons.empty() ? std::string("payment failed")
					     : Util::Str::join(reasons, ", ")
					     ;
	}
	return ret;
}

std::string parse_own_id(Jsmn::Object const& js) {
	return need_string(get(js, "nodeId"), "nodeId");
}

}}
