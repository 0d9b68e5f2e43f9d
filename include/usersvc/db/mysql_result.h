#pragma once
/**
 * @file mysql_result.h
 * @brief Owning handle for MYSQL_RES and conversion to ResultSet.
 */
#include <memory>

#include <mysql.h>

#include "usersvc/db/result_set.h"

namespace usersvc {

struct MySqlResultDeleter {
    void operator()(MYSQL_RES* r) const { if (r) mysql_free_result(r); }
};
using MySqlResultPtr = std::unique_ptr<MYSQL_RES, MySqlResultDeleter>;

/// Copies a stored (mysql_store_result) result into a ResultSet.
/// Needs no connection, so it may run after the connection is checked in.
ResultSet materialize(MYSQL_RES* res);

ColumnType column_type_of(const MYSQL_FIELD& f);

} // namespace usersvc
