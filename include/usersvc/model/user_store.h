#pragma once
/**
 * @file user_store.h
 * @brief Abstract read access to the user table.
 */
#include <vector>

#include "usersvc/model/user.h"

namespace usersvc {

/// Read access to the user table, shared by all request handlers.
class UserStore {
public:
    virtual ~UserStore() = default;

    /**
     * @brief Every row of the table, in result order.
     * @throws QueryError, FetchError, MappingError, PoolClosed
     */
    virtual std::vector<User> list_users() = 0;
};

} // namespace usersvc
