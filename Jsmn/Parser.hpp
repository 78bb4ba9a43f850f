#ifndef JSMN_PARSER_HPP
#define JSMN_PARSER_HPP

#include<string>

namespace Jsmn { class Object; }

namespace Jsmn {

/** Jsmn::parse
 *
 * @brief parses a complete response body that
 * contains exactly one JSON datum.
 *
 * @desc Leading and trailing whitespace is
 * ignored.
 * Throws Jsmn::ParseError if the body is empty,
 * truncated, malformed, or holds more than one
 * datum.
 */
Jsmn::Object parse(std::string const& s);

}

#endif /* !defined(JSMN_PARSER_HPP) */
