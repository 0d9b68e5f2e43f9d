#pragma once
/**
 * @file mysql_pool.h
 * @brief MySQL connections and the pool built from them.
 *
 * Input:  DbConfig (address, credentials, schema, pool size, TLS)
 * Output: MySqlPool whose leases expose MySqlConnection::raw()
 *
 * Every connection is opened up front; a failure aborts with ConnectError.
 */
#include <memory>
#include <string>

#include <mysql.h>

#include "usersvc/app/config.h"
#include "usersvc/db/mysql_result.h"
#include "usersvc/db/pool.h"

namespace usersvc {

class MySqlConnection {
public:
    MySqlConnection();
    ~MySqlConnection();
    MySqlConnection(const MySqlConnection&) = delete;
    MySqlConnection& operator=(const MySqlConnection&) = delete;

    /**
     * @brief Resolve, connect, authenticate and tune the socket.
     * @throws ConnectError with the client library's message on failure.
     */
    void open(const DbConfig& cfg);
    void close();
    MYSQL* raw();

    using Result = MySqlResultPtr;

    /**
     * @brief Run `sql` and pull the whole result set to the client.
     * @throws QueryError if the statement fails, FetchError if the result
     *         cannot be stored or the statement returned none.
     */
    Result run_query(const std::string& sql);

    /// Stored results need no connection; safe after checkin.
    static ResultSet materialize(const Result& res) { return usersvc::materialize(res.get()); }

private:
    MYSQL* conn_;
};

using MySqlPool = ConnectionPool<MySqlConnection>;

/// Opens cfg.pool_size connections and wraps them in a pool.
std::unique_ptr<MySqlPool> make_mysql_pool(const DbConfig& cfg);

/// getaddrinfo() wrapper returning the first numeric address of host.
/// @throws ConnectError when the name does not resolve.
std::string resolve_host(const std::string& host, uint16_t port);

/// Per-thread client library setup; call before using a connection on a
/// thread that did not open it.
void mysql_thread_attach();

} // namespace usersvc
