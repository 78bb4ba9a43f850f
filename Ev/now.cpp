#include"Ev/now.hpp"
#include<ev.h>

namespace Ev {

double now() {
	/* ev_now is cached at the start of each loop iteration,
	 * use ev_time so that long-running greenthreads see the
	 * actual wall clock.  */
	return ev_time();
}

}
