#pragma once
/**
 * @file config.h
 * @brief Application configuration model and loaders.
 *
 *  - DbConfig / ServerConfig / AppConfig hold validated settings
 *  - load_config(env) reads them from an environment lookup
 *  - parse_env_file / layered_env add optional `.env` file support
 *
 * All loaders throw ConfigError naming the offending variable.
 */
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <map>
#include <optional>
#include <string>

#include "usersvc/app/logger.h"

namespace usersvc {

struct DbConfig {
    std::string host;
    uint16_t port = 0;
    std::string database;
    std::string user;
    std::string password;

    std::string table = "users";
    unsigned pool_size = 4;
    unsigned connect_timeout = 5;   // seconds

    bool tls = true;
    bool trust_server_cert = false; // encrypt but skip certificate checks
    std::string ssl_ca;             // optional CA bundle for verification
    bool strict_columns = false;
};

struct ServerConfig {
    std::string host = "127.0.0.1";
    uint16_t port = 8080;
    unsigned threads = 0;           // 0 means "pick from hardware"
};

struct AppConfig {
    DbConfig db;
    ServerConfig server;
    LogLevel log_level = LogLevel::Info;
};

/// Returns the value of a variable, or nullopt when it is not set.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

/// Lookup backed by getenv().
EnvLookup process_env();

/// Lookup that consults `primary` first and falls back to `fallback`.
EnvLookup layered_env(EnvLookup primary, std::map<std::string, std::string> fallback);

/**
 * @brief Parse `.env` style text: KEY=VALUE lines, `#` comments,
 *        optional `export ` prefix, optional single/double quotes.
 */
std::map<std::string, std::string> parse_env(std::istream& in);

/// Reads and parses a `.env` file; throws ConfigError if it cannot be opened.
std::map<std::string, std::string> parse_env_file(const std::string& path);

/**
 * @brief Build and validate the whole configuration.
 * @throws ConfigError on any missing or malformed variable.
 */
AppConfig load_config(const EnvLookup& env);

// Exposed for reuse and tests.
std::optional<uint16_t> parse_port(const std::string& s);
std::optional<bool> parse_bool(const std::string& s);
bool is_valid_table(const std::string& t);

} // namespace usersvc
