#pragma once
/**
 * @file user_mapper.h
 * @brief ResultSet rows -> User values.
 *
 * Columns are found by name (id, username, email, full_name).
 * Lenient: missing column, NULL, wrong type or unparsable id become 0 / "".
 * Strict:  the same conditions throw MappingError.
 * Timestamps are never read.
 */
#include <vector>

#include "usersvc/db/result_set.h"
#include "usersvc/model/user.h"

namespace usersvc {

enum class ColumnPolicy { Lenient, Strict };

std::vector<User> map_users(const ResultSet& rs, ColumnPolicy policy);

} // namespace usersvc
