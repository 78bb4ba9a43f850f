#undef NDEBUG
#include"Jsmn/Object.hpp"
#include"Jsmn/Parser.hpp"
#include"Rebal/Eclair/parse.hpp"
#include<assert.h>

namespace {

auto const peer1 = std::string("020000000000000000000000000000000000000000000000000000000000000001");
auto const peer2 = std::string("030000000000000000000000000000000000000000000000000000000000000002");

template<typename E, typename F>
bool throws(F f) {
	try {
		f();
		return false;
	} catch (E const&) {
		return true;
	}
}

}

int main() {
	/* Older and newer layouts of /channels.  */
	{
		auto js = Jsmn::parse(R"JSON(
		[ { "nodeId": "020000000000000000000000000000000000000000000000000000000000000001"
		  , "channelId": "aa"
		  , "state": "NORMAL"
		  , "data": { "commitments": { "localCommit": { "spec": { "toLocal": 700000000
									, "toRemote": 250000000
									}
							      }
					     , "commitInput": { "amountSatoshis": 1000000 }
					     }
			    , "channelUpdate": { "shortChannelId": "100x1x0" }
			    }
		  }
		, { "nodeId": "030000000000000000000000000000000000000000000000000000000000000002"
		  , "channelId": "bb"
		  , "state": "OFFLINE"
		  , "data": { "commitments": { "active": [ { "localCommit": { "spec": { "toLocal": 100000000
											, "toRemote": 400000000
											}
									      }
							   , "fundingTx": { "amountSatoshis": 500000 }
							   }
							 ]
					     }
			    , "shortIds": { "real": { "status": "final", "realScid": "200x2x1" } }
			    }
		  }
		, { "nodeId": "030000000000000000000000000000000000000000000000000000000000000002"
		  , "channelId": "cc"
		  , "state": "WAIT_FOR_FUNDING_CONFIRMED"
		  , "data": { "commitments": {} }
		  }
		]
		)JSON");
		auto cs = Rebal::Eclair::parse_channels(js);
		assert(cs.size() == 2);

		assert(cs[0].id == Ln::Scid("100x1x0"));
		assert(cs[0].peer == Ln::NodeId(peer1));
		assert(cs[0].active);
		assert(cs[0].local == Ln::Amount::sat(700000));
		assert(cs[0].remote == Ln::Amount::sat(250000));
		assert(cs[0].capacity == Ln::Amount::sat(1000000));
		assert(cs[0].last_success == 0);

		assert(cs[1].id == Ln::Scid("200x2x1"));
		assert(cs[1].peer == Ln::NodeId(peer2));
		assert(!cs[1].active);
		assert(cs[1].local == Ln::Amount::sat(100000));
		assert(cs[1].capacity == Ln::Amount::sat(500000));
	}
	assert(throws<Rebal::NodeError>([]() {
		Rebal::Eclair::parse_channels(Jsmn::parse(R"JSON({"channels": []})JSON"));
	}));
	assert(throws<Rebal::NodeError>([]() {
		Rebal::Eclair::parse_channels(Jsmn::parse(R"JSON(
		[{ "nodeId": "nope", "state": "NORMAL"
		 , "data": {"channelUpdate": {"shortChannelId": "1x1x1"}}
		 }]
		)JSON"));
	}));

	/* /createinvoice.  */
	{
		auto inv = Rebal::Eclair::parse_invoice(Jsmn::parse(R"JSON(
		{ "prefix": "lnbcrt"
		, "timestamp": 1700000000
		, "nodeId": "020000000000000000000000000000000000000000000000000000000000000001"
		, "serialized": "lnbcrt1fake"
		, "description": "rebalance"
		, "paymentHash": "ab00000000000000000000000000000000000000000000000000000000000000"
		, "expiry": 3600
		, "amount": 300000000
		}
		)JSON"));
		assert(inv.id == "lnbcrt1fake");
		assert(inv.payment_hash == "ab00000000000000000000000000000000000000000000000000000000000000");
		assert(inv.amount == Ln::Amount::sat(300000));
		assert(inv.min_final_cltv_expiry == 0);
	}
	{
		auto inv = Rebal::Eclair::parse_invoice(Jsmn::parse(R"JSON(
		{ "serialized": "lnbcrt1other"
		, "paymentHash": "cd00000000000000000000000000000000000000000000000000000000000000"
		, "amount": 5000
		, "minFinalCltvExpiry": 18
		}
		)JSON"));
		assert(inv.min_final_cltv_expiry == 18);
		assert(inv.amount == Ln::Amount::msat(5000));
	}
	assert(throws<Rebal::NodeError>([]() {
		Rebal::Eclair::parse_invoice(Jsmn::parse(R"JSON(
		{ "serialized": "lnbcrt1other"
		, "paymentHash": "cd"
		, "amount": 5000
		, "minFinalCltvExpiry": "soon"
		}
		)JSON"));
	}));
	assert(throws<Rebal::NodeError>([]() {
		Rebal::Eclair::parse_invoice(Jsmn::parse(R"JSON({"serialized": 1})JSON"));
	}));

	/* /findroutebetweennodes, format=full.  */
	{
		auto route = Rebal::Eclair::parse_route(Jsmn::parse(R"JSON(
		{ "routes":
		  [ { "amount": 1000000
		    , "hops":
		      [ { "nodeId": "020000000000000000000000000000000000000000000000000000000000000001"
			, "nextNodeId": "030000000000000000000000000000000000000000000000000000000000000003"
			, "lastUpdate": { "shortChannelId": "300x1x0"
					, "feeBaseMsat": 1000
					, "feeProportionalMillionths": 100
					}
			}
		      , { "nodeId": "030000000000000000000000000000000000000000000000000000000000000003"
			, "nextNodeId": "030000000000000000000000000000000000000000000000000000000000000002"
			, "lastUpdate": { "shortChannelId": "400x1x0"
					, "feeBaseMsat": 0
					, "feeProportionalMillionths": 1000
					}
			}
		      ]
		    }
		  ]
		}
		)JSON"), Ln::Amount::sat(1000));
		assert(route.channels.size() == 2);
		assert(route.channels[0] == Ln::Scid("300x1x0"));
		assert(route.channels[1] == Ln::Scid("400x1x0"));
		/* 1000 + 100ppm of 1000000 + 1000ppm of 1000000.  */
		assert(route.fee == Ln::Amount::msat(1000 + 100 + 1000));
	}
	assert(throws<Rebal::NoRouteError>([]() {
		Rebal::Eclair::parse_route( Jsmn::parse(R"JSON({"routes": []})JSON")
					  , Ln::Amount::sat(1000)
					  );
	}));

	/* /allupdates.  */
	{
		auto js = Jsmn::parse(R"JSON(
		[ { "shortChannelId": "500x1x0", "feeBaseMsat": 5, "feeProportionalMillionths": 5 }
		, { "shortChannelId": "200x2x1", "feeBaseMsat": 500, "feeProportionalMillionths": 200 }
		]
		)JSON");
		auto fee = Rebal::Eclair::parse_channel_fee( js, Ln::Scid("200x2x1")
							   , Ln::Amount::sat(1000)
							   );
		assert(fee == Ln::Amount::msat(700));
		assert(throws<Rebal::NodeError>([&]() {
			Rebal::Eclair::parse_channel_fee( js, Ln::Scid("9x9x9")
							, Ln::Amount::sat(1000)
							);
		}));
	}

	/* /getsentinfo.  */
	{
		auto s = Rebal::Eclair::parse_sent_info(Jsmn::parse("[]"));
		assert(s.type == Rebal::PaymentStatus::Pending);

		s = Rebal::Eclair::parse_sent_info(Jsmn::parse(R"JSON(
		[ { "id": "x", "status": { "type": "pending" } } ]
		)JSON"));
		assert(s.type == Rebal::PaymentStatus::Pending);

		s = Rebal::Eclair::parse_sent_info(Jsmn::parse(R"JSON(
		[ { "id": "x", "status": { "type": "failed"
					 , "failures": [ { "failureMessage": "temporary channel failure" } ]
					 } }
		, { "id": "y", "status": { "type": "sent", "feesPaid": 1200 } }
		, { "id": "z", "status": { "type": "sent", "feesPaid": 34 } }
		]
		)JSON"));
		assert(s.type == Rebal::PaymentStatus::Succeeded);
		assert(s.fee == Ln::Amount::msat(1234));

		s = Rebal::Eclair::parse_sent_info(Jsmn::parse(R"JSON(
		[ { "id": "x", "status": { "type": "failed"
					 , "failures": [ { "failureMessage": "temporary channel failure" } ]
					 } }
		, { "id": "y", "status": { "type": "failed"
					 , "failures": [ { "t": "route not found" } ]
					 } }
		]
		)JSON"));
		assert(s.type == Rebal::PaymentStatus::Failed);
		assert(s.reason == "temporary channel failure, route not found");
	}

	/* /getinfo.  */
	assert(Rebal::Eclair::parse_own_id(Jsmn::parse(R"JSON(
		{ "version": "0.9.0", "nodeId": "020000000000000000000000000000000000000000000000000000000000000001" }
	)JSON")) == peer1);

	return 0;
}
