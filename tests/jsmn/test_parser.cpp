#undef NDEBUG
#include"Jsmn/Object.hpp"
#include"Jsmn/ParseError.hpp"
#include"Jsmn/Parser.hpp"
#include<assert.h>
#include<sstream>

namespace {

bool fails(std::string const& s) {
	try {
		(void) Jsmn::parse(s);
	} catch (Jsmn::ParseError const&) {
		return true;
	}
	return false;
}

}

int main() {
	/* A typical response body.  */
	{
		auto js = Jsmn::parse(R"JSON(
			{"nodeId": "02aa", "alias": "alice", "blockHeight": 800123}
		)JSON");
		assert(js.is_object());
		assert(js.size() == 3);
		assert(std::string(js["alias"]) == "alice");
		assert(double(js["blockHeight"]) == 800123);
		assert(js["missing"].is_null());
	}

	/* Empty containers.  */
	{
		auto js = Jsmn::parse("[ [], {} ]");
		assert(js.is_array());
		assert(js.size() == 2);
		assert(js[0].is_array());
		assert(js[0].size() == 0);
		assert(js[1].is_object());
		assert(js[1].keys().empty());
	}

	/* Escapes inside strings.  */
	assert(std::string(Jsmn::parse(R"JSON("a\"b")JSON")) == "a\"b");

	/* Brackets inside strings do not end a datum.  */
	{
		auto js = Jsmn::parse(R"JSON(
			{ "failures": [ { "t": "]} temporary failure {[" } ] }
		)JSON");
		auto failures = js["failures"];
		assert(failures.is_array());
		assert(failures.size() == 1);
		assert(std::string(failures[0]["t"]) == "]} temporary failure {[");
		assert(failures[1].is_null());
	}

	/* Iteration over route hops.  */
	{
		auto js = Jsmn::parse(R"JSON(
			[ {"shortChannelId": "100x1x0", "feeBaseMsat": 1000}
			, {"shortChannelId": "300x3x0", "feeBaseMsat": 0}
			, {"shortChannelId": "200x2x0", "feeBaseMsat": 1}
			]
		)JSON");
		auto ids = std::string();
		auto total = double(0);
		for (auto hop : js) {
			ids += std::string(hop["shortChannelId"]) + ";";
			total += double(hop["feeBaseMsat"]);
		}
		assert(ids == "100x1x0;300x3x0;200x2x0;");
		assert(total == 1001);
	}

	/* Types.  */
	{
		auto js = Jsmn::parse(R"JSON(
			{"active": true, "closed": false, "note": null, "ppm": 10}
		)JSON");
		assert(js["active"].is_boolean());
		assert(bool(js["active"]));
		assert(!bool(js["closed"]));
		assert(js["note"].is_null());
		assert(js["ppm"].is_number());
		assert(js.has("note"));
		assert(!js.has("fee"));

		auto caught = false;
		try {
			(void) std::string(js["ppm"]);
		} catch (Jsmn::TypeError const&) {
			caught = true;
		}
		assert(caught);
	}

	/* A bare number at the end of a body.  */
	assert(double(Jsmn::parse("42")) == 42);

	/* Printing gives back the JSON text.  */
	{
		auto js = Jsmn::parse(R"JSON({"error":"bad request"})JSON");
		auto os = std::ostringstream();
		os << js["error"];
		assert(os.str() == "\"bad request\"");
	}

	assert(fails(""));
	assert(fails("   "));
	assert(fails("{\"truncated\": "));
	assert(fails("[1, 2"));
	assert(fails("{} {}"));
	assert(fails("\"done\" 1"));
	assert(fails("{1: 2}"));

	return 0;
}
