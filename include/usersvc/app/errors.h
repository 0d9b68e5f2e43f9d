#pragma once
/**
 * @file errors.h
 * @brief Exception types raised across the service.
 *
 * Startup errors (ConfigError, ConnectError) abort the process.
 * Request errors (QueryError, FetchError, MappingError, PoolClosed) are
 * caught at the handler boundary and turned into a generic 500.
 */
#include <stdexcept>
#include <string>

namespace usersvc {

struct ConfigError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

/// Base for everything that goes wrong while talking to MySQL.
struct DbError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct ConnectError : DbError {
    using DbError::DbError;
};

/// The statement itself was rejected or failed to execute.
struct QueryError : DbError {
    using DbError::DbError;
};

/// The statement ran but its result set could not be transferred.
struct FetchError : DbError {
    using DbError::DbError;
};

/// A row did not match the expected columns (strict policy only).
struct MappingError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct PoolClosed : std::runtime_error {
    PoolClosed() : std::runtime_error("connection pool closed") {}
};

} // namespace usersvc
