#undef NDEBUG
#include"Util/Str.hpp"
#include"Util/date.hpp"
#include<assert.h>

int main() {
	/* Timestamps in logs and reports.  */
	assert(Util::date(0.0) == "UTC 1970-01-01 00:00:00.000");
	assert(Util::date(1700000000.25) == "UTC 2023-11-14 22:13:20.250");

	assert(Util::Str::fmt("%zu hops, fee %s", std::size_t(3), "2100msat")
	       == "3 hops, fee 2100msat"
	      );

	assert(Util::Str::trim("  poll-interval \t") == "poll-interval");
	assert(Util::Str::trim("   ") == "");

	auto parts = Util::Str::split("100x1x0,,200x2x0", ',');
	assert(parts.size() == 3);
	assert(parts[0] == "100x1x0");
	assert(parts[1] == "");
	assert(parts[2] == "200x2x0");
	assert(Util::Str::join(parts, ",") == "100x1x0,,200x2x0");
	assert(Util::Str::join({}, ",") == "");
	assert(Util::Str::join({"only"}, ", ") == "only");

	assert(Util::Str::ishex("02ab"));
	assert(!Util::Str::ishex("02a"));
	assert(!Util::Str::ishex("zz"));
	auto bytes = Util::Str::hexread("00ff10");
	assert(bytes.size() == 3);
	assert(bytes[1] == 0xff);
	assert(Util::Str::hexdump(bytes.data(), bytes.size()) == "00ff10");

	auto caught = false;
	try {
		(void) Util::Str::hexread("0g");
	} catch (Util::Str::HexParseFailure const&) {
		caught = true;
	}
	assert(caught);

	return 0;
}
