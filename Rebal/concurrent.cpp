#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Rebal/Shutdown.hpp"
#include"Rebal/concurrent.hpp"

namespace Rebal {

Ev::Io<void> concurrent(Ev::Io<void> io) {
	return Ev::concurrent(io.catching<Rebal::Shutdown>([](Rebal::Shutdown const&) {
		return Ev::lift();
	}));
}

}
