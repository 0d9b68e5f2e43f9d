/**
 * @file user_dao.cpp
 * @brief Listing SQL and the MySQL instantiation of PooledUserDao.
 */
#include "usersvc/model/user_dao.h"

namespace usersvc {

std::string list_users_sql(const std::string& table){
    return "SELECT id, username, email, full_name FROM `" + table + "`";
}

template class PooledUserDao<MySqlConnection>;

} // namespace usersvc
