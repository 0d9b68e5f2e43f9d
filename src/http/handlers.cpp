/**
 * @file handlers.cpp
 * @brief Route handlers, error-to-status mapping, access log.
 */
#include "usersvc/http/handlers.h"
#include "usersvc/app/errors.h"
#include "usersvc/app/logger.h"

#include <exception>

namespace usersvc {

void json_reply(httplib::Response& res, int status, const json& body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

void handle_health(httplib::Response& res) {
    LOGI("Health check endpoint called");
    json_reply(res, 200, kHealthMessage);
}

void handle_list_users(UserStore& store, httplib::Response& res) {
    LOGI("GET /users endpoint called");
    try {
        auto users = store.list_users();
        json_reply(res, 200, json(users));
    } catch (const QueryError& e) {
        LOGE("%s", e.what());
        json_reply(res, 500, kQueryFailed);
    } catch (const FetchError& e) {
        LOGE("%s", e.what());
        json_reply(res, 500, kFetchFailed);
    } catch (const MappingError& e) {
        LOGE("Failed to map rows: %s", e.what());
        json_reply(res, 500, kFetchFailed);
    } catch (const std::exception& e) {
        LOGE("list users failed: %s", e.what());
        json_reply(res, 500, kInternalError);
    }
}

void install_routes(httplib::Server& svr, UserStore& store) {
    svr.Get("/health", [](const httplib::Request&, httplib::Response& res){
        handle_health(res);
    });

    svr.Get("/users", [&store](const httplib::Request&, httplib::Response& res){
        handle_list_users(store, res);
    });
}

void install_hooks(httplib::Server& svr) {
    svr.set_logger([](const httplib::Request& req, const httplib::Response& res){
        LOGI("%s %s -> %d", req.method.c_str(), req.path.c_str(), res.status);
    });

    svr.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep){
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            LOGE("unhandled exception on %s: %s", req.path.c_str(), e.what());
        } catch (...) {
            LOGE("unhandled non-standard exception on %s", req.path.c_str());
        }
        json_reply(res, 500, kInternalError);
    });
}

} // namespace usersvc
