#include"Rebal/RebalanceAttempt.hpp"
#include"Util/BacktraceException.hpp"
#include<stdexcept>

namespace Rebal {

char const* status_string(AttemptStatus s) {
	switch (s) {
	case Pending: return "pending";
	case InFlight: return "inflight";
	case Succeeded: return "succeeded";
	case Failed: return "failed";
	case Ambiguous: return "ambiguous";
	}
	return "unknown";
}

AttemptStatus status_from_string(std::string const& s) {
	if (s == "pending")
		return Pending;
	if (s == "inflight")
		return InFlight;
	if (s == "succeeded")
		return Succeeded;
	if (s == "failed")
		return Failed;
	if (s == "ambiguous")
		return Ambiguous;
	throw Util::BacktraceException<std::invalid_argument>(
		std::string("Unknown attempt status: ") + s
	);
}

}
