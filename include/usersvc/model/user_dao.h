#pragma once
/**
 * @file user_dao.h
 * @brief MySQL-backed UserStore.
 */
#include "usersvc/db/mysql_pool.h"
#include "usersvc/model/pooled_user_dao.h"

namespace usersvc {

using MySqlUserDao = PooledUserDao<MySqlConnection>;

extern template class PooledUserDao<MySqlConnection>;

} // namespace usersvc
