#ifndef UTIL_DATE_HPP
#define UTIL_DATE_HPP

#include<string>

namespace Util {

/** Util::date
 *
 * @brief Returns a simple UTC date representation
 * of the given Unix Epoch time, with milliseconds.
 */
std::string date(double epoch);

}

#endif /* !defined(UTIL_DATE_HPP) */
