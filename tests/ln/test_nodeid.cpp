#undef NDEBUG
#include"Ln/NodeId.hpp"
#include<assert.h>
#include<set>
#include<sstream>

namespace {

auto const alice = "02a209432db157f414e668dbce5ee0f986dedd7b9ecbbdb4cf9a47215e85f70d5c";
auto const bob = "03dfafd14dbaeda53f23e01e83af79452a2058a40291daa76552913b503c501e22";

}

int main() {
	assert(Ln::NodeId::valid_string(alice));
	assert(Ln::NodeId::valid_string(bob));
	/* Wrong prefix, length, or digits.  */
	assert(!Ln::NodeId::valid_string(std::string("04") + (alice + 2)));
	assert(!Ln::NodeId::valid_string(std::string(alice) + "00"));
	assert(!Ln::NodeId::valid_string(std::string(alice, 64)));
	assert(!Ln::NodeId::valid_string(std::string("02zz") + (alice + 4)));

	auto threw = false;
	try {
		(void) Ln::NodeId("not a node");
	} catch (std::range_error const&) {
		threw = true;
	}
	assert(threw);

	/* The null id.  */
	auto none = Ln::NodeId();
	assert(!none);
	assert(none == Ln::NodeId(std::string(66, '0')));
	assert(std::string(none) == std::string(66, '0'));

	auto a = Ln::NodeId(alice);
	auto b = Ln::NodeId(bob);
	assert(a);
	assert(a != b);
	assert(a != none);
	assert(std::string(a) == alice);
	assert(a == Ln::NodeId(std::string(alice)));

	/* Include and exclude lists are sets of ids.  */
	auto peers = std::set<Ln::NodeId>{a, b, Ln::NodeId(alice)};
	assert(peers.size() == 2);
	assert(peers.count(Ln::NodeId(bob)) == 1);
	assert(peers.count(none) == 0);

	auto ss = std::stringstream();
	ss << a << " " << b;
	auto x = Ln::NodeId();
	auto y = Ln::NodeId();
	ss >> x >> y;
	assert(x == a);
	assert(y == b);

	return 0;
}
