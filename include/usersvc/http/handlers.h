#pragma once
/**
 * @file handlers.h
 * @brief HTTP routes and hooks.
 *
 *  - GET /health   fixed JSON string, no database access
 *  - GET /users    UserStore::list_users() as a JSON array, or a generic 500
 */
#include <string>
#include <httplib.h>
#include <nlohmann/json.hpp>

#include "usersvc/model/user.h"
#include "usersvc/model/user_store.h"

namespace usersvc {

inline constexpr const char* kHealthMessage = "Server is running!";
inline constexpr const char* kQueryFailed = "Database query failed";
inline constexpr const char* kFetchFailed = "Failed to process query results";
inline constexpr const char* kInternalError = "Internal server error";

/// Registers GET /health and GET /users. `store` must outlive `svr`.
void install_routes(httplib::Server& svr, UserStore& store);

/// Access log line per response, plus a 500 fallback for escaped exceptions.
void install_hooks(httplib::Server& svr);

void handle_health(httplib::Response& res);
void handle_list_users(UserStore& store, httplib::Response& res);

void json_reply(httplib::Response& res, int status, const json& body);

} // namespace usersvc
