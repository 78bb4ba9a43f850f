#ifndef REBAL_MSG_BEGIN_HPP
#define REBAL_MSG_BEGIN_HPP

namespace Rebal { namespace Msg {

/** struct Rebal::Msg::Begin
 *
 * @brief raised once, after all modules have been
 * constructed and before anything else is done.
 */
struct Begin { };

}}

#endif /* !defined(REBAL_MSG_BEGIN_HPP) */
