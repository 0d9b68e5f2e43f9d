/**
 * @file main.cpp
 * @brief Service entry: load config, open the MySQL pool, register routes, serve.
 *
 * Routes:
 *  - GET /health   liveness, never touches the database
 *  - GET /users    every row of the configured table as a JSON array
 */
#include <cstring>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <string>

#include <httplib.h>

#include "usersvc/app/config.h"
#include "usersvc/app/errors.h"
#include "usersvc/app/logger.h"
#include "usersvc/db/mysql_pool.h"
#include "usersvc/http/handlers.h"
#include "usersvc/model/user_dao.h"

using namespace usersvc;

static void print_help(){
    std::cout << "Usage: usersvc [--env-file PATH]\n"
              << "Reads DB_HOST, DB_PORT, DB_NAME, DB_USER, DB_PASSWORD (required) and\n"
              << "DB_TABLE, DB_POOL_SIZE, DB_CONNECT_TIMEOUT, DB_TLS, DB_TRUST_SERVER_CERT,\n"
              << "DB_SSL_CA, DB_STRICT_COLUMNS, HTTP_HOST, HTTP_PORT, HTTP_THREADS, LOG_LEVEL\n"
              << "from the environment, falling back to ./.env.\n";
}

int main(int argc, char** argv){
    std::string env_file = ".env";
    bool env_file_explicit = false;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--help") == 0) { print_help(); return 0; }
        if (std::strcmp(argv[i], "--env-file") == 0 && i + 1 < argc) {
            env_file = argv[++i];
            env_file_explicit = true;
        } else {
            std::cerr << "unknown argument: " << argv[i] << "\n";
            print_help();
            return 1;
        }
    }

    AppConfig cfg;
    try {
        std::map<std::string, std::string> file_vars;
        if (env_file_explicit || std::ifstream(env_file).good()) {
            file_vars = parse_env_file(env_file);
        }
        cfg = load_config(layered_env(process_env(), std::move(file_vars)));
    } catch (const ConfigError& e) {
        LOGE("fatal: %s", e.what());
        return 1;
    }
    set_log_level(cfg.log_level);

    std::unique_ptr<MySqlPool> pool;
    try {
        pool = make_mysql_pool(cfg.db);
    } catch (const std::exception& e) {
        LOGE("fatal: Failed to connect to database: %s", e.what());
        return 1;
    }

    MySqlUserDao dao(*pool, cfg.db.table,
                     cfg.db.strict_columns ? ColumnPolicy::Strict : ColumnPolicy::Lenient);

    httplib::Server svr;
    unsigned threads = cfg.server.threads;
    svr.new_task_queue = [threads]{ return new httplib::ThreadPool(threads); };
    install_hooks(svr);
    install_routes(svr, dao);

    LOGI("Starting server at http://%s:%u", cfg.server.host.c_str(), (unsigned)cfg.server.port);
    if (!svr.bind_to_port(cfg.server.host.c_str(), cfg.server.port)) {
        LOGE("bind failed on %s:%u", cfg.server.host.c_str(), (unsigned)cfg.server.port);
        return 2;
    }
    svr.listen_after_bind();
    pool->close();
    return 0;
}
