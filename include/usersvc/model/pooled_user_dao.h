#pragma once
/**
 * @file pooled_user_dao.h
 * @brief UserStore over any ConnectionPool.
 *
 * list_users(): check out a connection, run the fixed SELECT, keep the
 * stored result, check the connection back in, then materialize and map.
 *
 * Conn must provide:
 *  - typedef Result          (default-constructible, movable)
 *  - Result run_query(sql)   throws QueryError / FetchError
 *  - static ResultSet materialize(const Result&)
 */
#include <string>
#include <utility>
#include <vector>

#include "usersvc/app/logger.h"
#include "usersvc/db/pool.h"
#include "usersvc/model/user_mapper.h"
#include "usersvc/model/user_store.h"

namespace usersvc {

/// SELECT id, username, email, full_name FROM `table`
std::string list_users_sql(const std::string& table);

template <typename Conn>
class PooledUserDao : public UserStore {
public:
    /// `table` must already satisfy is_valid_table().
    PooledUserDao(ConnectionPool<Conn>& pool, const std::string& table, ColumnPolicy policy)
        : pool_(pool), sql_(list_users_sql(table)), policy_(policy) {}

    std::vector<User> list_users() override {
        typename Conn::Result raw;
        {
            auto conn = pool_.acquire();
            LOGI("Database connection acquired");
            raw = conn->run_query(sql_);
        } // connection checked back in here

        ResultSet rs = Conn::materialize(raw);
        raw = typename Conn::Result();
        LOGI("Found %zu rows", rs.rows.size());

        auto users = map_users(rs, policy_);
        LOGI("Returning %zu users", users.size());
        return users;
    }

    const std::string& sql() const { return sql_; }

private:
    ConnectionPool<Conn>& pool_;
    std::string sql_;
    ColumnPolicy policy_;
};

} // namespace usersvc
