#ifndef REBAL_MSG_DBRESOURCE_HPP
#define REBAL_MSG_DBRESOURCE_HPP

#include"Sqlite3/Db.hpp"

namespace Rebal { namespace Msg {

/** struct Rebal::Msg::DbResource
 *
 * @brief provides access to the db.
 *
 * @desc Modules with persistent state create their
 * tables and load their state when this is
 * raised.
 * Tests raise it with an in-memory database.
 */
struct DbResource {
	Sqlite3::Db db;
};

}}

#endif /* !defined(REBAL_MSG_DBRESOURCE_HPP) */
