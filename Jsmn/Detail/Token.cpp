#include"Jsmn/Detail/Token.hpp"

namespace Jsmn { namespace Detail {

/* Skips over the token and all its children.
 * Object keys count as children of the object, and
 * each key has its value as its single child.
 */
void Token::next(Token const*& tokptr) {
	auto remaining = 1;
	while (remaining > 0) {
		remaining += tokptr->size;
		--remaining;
		++tokptr;
	}
}

}}
