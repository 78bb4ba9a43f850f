#include"Ev/Io.hpp"
#include"Ev/ThreadPool.hpp"
#include"Jsmn/Object.hpp"
#include"Jsmn/ParseError.hpp"
#include"Jsmn/Parser.hpp"
#include"Rebal/Channel.hpp"
#include"Rebal/Eclair/Node.hpp"
#include"Rebal/Eclair/parse.hpp"
#include"Util/Str.hpp"
#include"Util/make_unique.hpp"
#include"Util/stringify.hpp"
#include<assert.h>
#include<cctype>
#include<curl/curl.h>
#include<map>
#include<utility>

namespace {

typedef std::vector<std::pair<std::string, std::string>> Params;

/* Class to create a CURL easy handle for one
 * Eclair API call, then execute it.  */
class EasyHandle {
private:
	std::string body;
	std::vector<char> errbuf;
	CURL* curl;

	EasyHandle() {
		errbuf.resize(CURL_ERROR_SIZE);
		for (auto& b : errbuf)
			b = 0;
		curl = curl_easy_init();
		if (!curl)
			throw Rebal::ConnectivityError("Eclair: curl_easy_init failed");
		curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, &errbuf[0]);
	}
	~EasyHandle() {
		curl_easy_cleanup(curl);
	}

public:
	static
	Jsmn::Object run( std::string const& url
			, std::string const& password
			, double timeout
			, Params const& params
			) {
		EasyHandle self;
		self.run_core(url, password, timeout, params);
		return self.result(url);
	}

private:
	static
	size_t write_cb_s(char* ptr, size_t size, size_t nmemb, void* vself) {
		assert(size == 1);
		return ((EasyHandle*)vself)->write_cb(ptr, nmemb);
	}
	size_t write_cb(char* ptr, size_t size) {
		body.append(ptr, size);
		return size;
	}

	std::string escape(std::string const& s) {
		auto esc = curl_easy_escape(curl, s.c_str(), int(s.size()));
		if (!esc)
			throw Rebal::ConnectivityError("Eclair: curl_easy_escape failed");
		auto ret = std::string(esc);
		curl_free(esc);
		return ret;
	}
	std::string form(Params const& params) {
		auto ret = std::string();
		for (auto const& p : params) {
			if (ret != "")
				ret += "&";
			ret += escape(p.first) + "=" + escape(p.second);
		}
		return ret;
	}

	void run_core( std::string const& url
		     , std::string const& password
		     , double timeout
		     , Params const& params
		     ) {
		curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &write_cb_s);
		curl_easy_setopt(curl, CURLOPT_WRITEDATA, this);
		curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
		curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 1L);
		curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
		curl_easy_setopt(curl, CURLOPT_HTTPAUTH, (long) CURLAUTH_BASIC);
		curl_easy_setopt(curl, CURLOPT_USERNAME, "eclair-cli");
		curl_easy_setopt(curl, CURLOPT_PASSWORD, password.c_str());
		curl_easy_setopt( curl, CURLOPT_TIMEOUT_MS
				, (long) (timeout * 1000)
				);
		/* Needs to survive until after curl_easy_perform.  */
		auto postfields = form(params);
		curl_easy_setopt(curl, CURLOPT_POST, 1L);
		curl_easy_setopt( curl, CURLOPT_POSTFIELDS
				, postfields.c_str()
				);
		curl_easy_setopt( curl, CURLOPT_POSTFIELDSIZE_LARGE
				, (curl_off_t) postfields.size()
				);
		curl_easy_setopt( curl, CURLOPT_USERAGENT
				, "rebalancer/" PACKAGE_VERSION
				);

		auto ret = curl_easy_perform(curl);
		if (ret != 0) {
			auto msg = std::string(curl_easy_strerror(ret))
				 + ": "
				 + std::string(&errbuf[0])
				 ;
			throw Rebal::ConnectivityError("Eclair: " + url + ": " + msg);
		}
	}

	Jsmn::Object result(std::string const& url) {
		auto code = long(0);
		curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
		if (code == 401)
			throw Rebal::NodeError("Eclair: " + url + ": "
					       "authentication failed"
					      );

		auto js = Jsmn::Object();
		try {
			js = Jsmn::parse(body);
		} catch (Jsmn::ParseError const& e) {
			throw Rebal::NodeError( "Eclair: " + url + ": "
					      + "HTTP " + Util::stringify(code)
					      + ": unparseable response: "
					      + e.what()
					      );
		}
		if (js.is_object() && js.has("error")) {
			auto err = js["error"];
			auto msg = err.is_string() ? std::string(err)
						   : Util::stringify(err)
						   ;
			throw Rebal::NodeError("Eclair: " + url + ": " + msg);
		}
		if (code >= 400)
			throw Rebal::NodeError( "Eclair: " + url + ": HTTP "
					      + Util::stringify(code)
					      );
		return js;
	}
};

bool is_payment_hash(std::string const& s) {
	if (s.size() != 64)
		return false;
	for (auto c : s)
		if (!std::isxdigit((unsigned char) c))
			return false;
	return true;
}

std::string msat_string(Ln::Amount a) {
	return Util::stringify(a.to_msat());
}

}

namespace Rebal { namespace Eclair {

class Node::Impl {
private:
	Ev::ThreadPool& threadpool;
	std::string url;
	std::string password;
	double call_timeout;

	std::string own_id;
	std::map<Ln::Scid, Ln::NodeId> peers;

	Ev::Io<Jsmn::Object> call(std::string api, Params params) {
		auto pparams = std::make_shared<Params>(std::move(params));
		return threadpool.background<Jsmn::Object>([ this
							   , api
							   , pparams
							   ]() {
			return EasyHandle::run( url + "/" + api
					      , password
					      , call_timeout
					      , *pparams
					      );
		});
	}

	Ev::Io<std::string> get_own_id() {
		if (own_id != "")
			return Ev::lift(own_id);
		return call("getinfo", Params()).then([this](Jsmn::Object js) {
			own_id = parse_own_id(js);
			return Ev::lift(own_id);
		});
	}

	/* Peers of the two hinted channels.  */
	Ev::Io<std::pair<Ln::NodeId, Ln::NodeId>>
	get_peers(RouteHints const& hints) {
		auto known = [this, hints]() {
			return peers.count(hints.source) != 0
			    && peers.count(hints.destination) != 0
			     ;
		};
		auto act = Ev::lift();
		if (!known())
			act = list_channels().then([](std::vector<Channel>) {
				return Ev::lift();
			});
		return act.then([this, hints, known]() {
			if (!known())
				throw NoRouteError( "Eclair: unknown channel "
						  + std::string(hints.source)
						  + " or "
						  + std::string(hints.destination)
						  );
			return Ev::lift(std::make_pair( peers[hints.source]
						      , peers[hints.destination]
						      ));
		});
	}

public:
	Impl( Ev::ThreadPool& threadpool_
	    , std::string url_
	    , std::string password_
	    , double call_timeout_
	    ) : threadpool(threadpool_)
	      , url(std::move(url_))
	      , password(std::move(password_))
	      , call_timeout(call_timeout_)
	      {
		while (url.size() != 0 && url.back() == '/')
			url.pop_back();
	}

	Ev::Io<std::vector<Channel>> list_channels() {
		return call("channels", Params()).then([this](Jsmn::Object js) {
			auto channels = parse_channels(js);
			for (auto const& c : channels)
				peers[c.id] = c.peer;
			return Ev::lift(std::move(channels));
		});
	}

	Ev::Io<Invoice> create_invoice( Ln::Amount amount
				      , std::string const& description
				      ) {
		return call("createinvoice", Params{
			{"description", description},
			{"amountMsat", msat_string(amount)}
		}).then([](Jsmn::Object js) {
			return Ev::lift(parse_invoice(js));
		});
	}

	Ev::Io<Route> find_route(RouteHints const& hints, Ln::Amount amount) {
		auto pme = std::make_shared<std::string>();
		auto pends = std::make_shared<std::pair<Ln::NodeId, Ln::NodeId>>();
		auto proute = std::make_shared<Route>();
		return get_own_id().then([this, hints, pme](std::string me) {
			*pme = std::move(me);
			return get_peers(hints);
		}).then([ this, hints, amount, pme, pends
			](std::pair<Ln::NodeId, Ln::NodeId> ends) {
			*pends = ends;
			auto ignored = std::string(hints.source)
				     + ","
				     + std::string(hints.destination)
				     ;
			return call("findroutebetweennodes", Params{
				{"sourceNodeId", std::string(ends.first)},
				{"targetNodeId", std::string(ends.second)},
				{"amountMsat", msat_string(amount)},
				{"ignoreNodeIds", *pme},
				{"ignoreShortChannelIds", ignored},
				{"format", "full"}
			}).catching<NodeError>([](NodeError const& e) {
				/* Eclair answers with an error when it
				 * finds no path.  */
				throw NoRouteError(e.what());
				return Ev::lift(Jsmn::Object());
			});
		}).then([this, amount, pends, proute](Jsmn::Object js) {
			*proute = parse_route(js, amount);
			return call("allupdates", Params{
				{"nodeId", std::string(pends->second)}
			});
		}).then([hints, amount, proute](Jsmn::Object js) {
			auto last_fee = parse_channel_fee(js, hints.destination, amount);

			auto ret = Route();
			ret.channels.push_back(hints.source);
			for (auto const& c : proute->channels)
				ret.channels.push_back(c);
			ret.channels.push_back(hints.destination);
			ret.fee = proute->fee + last_fee;
			return Ev::lift(std::move(ret));
		});
	}

	Ev::Io<std::string> pay_invoice( Invoice const& invoice
				       , Ln::Amount max_fee
				       , Route const& route
				       ) {
		if (route.fee > max_fee)
			return Ev::lift().then([route, max_fee]() {
				throw PaymentFailed( "route fee "
						   + std::string(route.fee)
						   + " exceeds ceiling "
						   + std::string(max_fee)
						   );
				return Ev::lift(std::string());
			});
		auto scids = std::vector<std::string>();
		for (auto const& c : route.channels)
			scids.push_back(std::string(c));
		auto params = Params{
			{"shortChannelIds", Util::Str::join(scids, ",")},
			{"amountMsat", msat_string(invoice.amount)},
			{"paymentHash", invoice.payment_hash},
			{"invoice", invoice.id}
		};
		if (invoice.min_final_cltv_expiry != 0)
			params.emplace_back( "finalCltvExpiry"
					   , Util::stringify(invoice.min_final_cltv_expiry)
					   );
		return call("sendtoroute", std::move(params)).then([invoice](Jsmn::Object) {
			/* The payment hash covers every part Eclair
			 * splits the payment into.  */
			return Ev::lift(invoice.payment_hash);
		}).catching<NodeError>([](NodeError const& e) {
			throw PaymentFailed(e.what());
			return Ev::lift(std::string());
		});
	}

	Ev::Io<PaymentStatus> get_payment_status(std::string const& attempt_id) {
		auto key = is_payment_hash(attempt_id) ? "paymentHash" : "id";
		return call("getsentinfo", Params{
			{key, attempt_id}
		}).then([](Jsmn::Object js) {
			return Ev::lift(parse_sent_info(js));
		});
	}

	Ev::Io<void> cancel_invoice(std::string const& payment_hash) {
		return call("deleteinvoice", Params{
			{"paymentHash", payment_hash}
		}).then([](Jsmn::Object) {
			return Ev::lift();
		});
	}
};

Node::~Node() =default;

Node::Node( Ev::ThreadPool& threadpool
	  , std::string url
	  , std::string password
	  , double call_timeout
	  ) : pimpl(Util::make_unique<Impl>( threadpool
					   , std::move(url)
					   , std::move(password)
					   , call_timeout
					   )) { }

Ev::Io<std::vector<Rebal::Channel>> Node::list_channels() {
	return pimpl->list_channels();
}
Ev::Io<Rebal::Invoice> Node::create_invoice( Ln::Amount amount
					   , std::string const& description
					   ) {
	return pimpl->create_invoice(amount, description);
}
Ev::Io<Rebal::Route> Node::find_route( Rebal::RouteHints const& hints
				     , Ln::Amount amount
				     ) {
	return pimpl->find_route(hints, amount);
}
Ev::Io<std::string> Node::pay_invoice( Rebal::Invoice const& invoice
				     , Ln::Amount max_fee
				     , Rebal::Route const& route
				     ) {
	return pimpl->pay_invoice(invoice, max_fee, route);
}
Ev::Io<Rebal::PaymentStatus>
Node::get_payment_status(std::string const& attempt_id) {
	return pimpl->get_payment_status(attempt_id);
}
Ev::Io<void> Node::cancel_invoice(std::string const& payment_hash) {
	return pimpl->cancel_invoice(payment_hash);
}

}}
