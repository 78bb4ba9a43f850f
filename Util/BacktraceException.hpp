#ifndef UTIL_BACKTRACE_EXCEPTION_HPP
#define UTIL_BACKTRACE_EXCEPTION_HPP

#include<utility>

namespace Util {

/** class Util::BacktraceException<E>
 *
 * @brief Common wrapper for the exceptions thrown by
 * this program, so that they can be extended in one
 * place.
 *
 * @desc Derives from E and forwards all constructor
 * arguments to it, so that code catching E (or
 * std::exception) still catches it.
 */
template<typename T>
class BacktraceException : public T {
public:
	template<typename... Args>
	BacktraceException(Args&&... args)
		: T(std::forward<Args>(args)...) { }

	const char* what() const noexcept override {
		return T::what();
	}
};

}

#endif /* !defined(UTIL_BACKTRACE_EXCEPTION_HPP) */
