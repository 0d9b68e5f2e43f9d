/**
 * @file config.cpp
 * @brief Environment / `.env` configuration loading.
 */
#include "usersvc/app/config.h"
#include "usersvc/app/errors.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <regex>
#include <thread>

namespace usersvc {

namespace {

std::string trim(const std::string& s){
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::optional<unsigned long> parse_unsigned(const std::string& s){
    if (s.empty() || s.size() > 10) return std::nullopt;
    for (char c : s) if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    return std::stoul(s);
}

std::string require(const EnvLookup& env, const char* key){
    auto v = env(key);
    if (!v) throw ConfigError(std::string(key) + " environment variable not set");
    return *v;
}

std::string require_non_empty(const EnvLookup& env, const char* key){
    std::string v = require(env, key);
    if (v.empty()) throw ConfigError(std::string(key) + " must not be empty");
    return v;
}

uint16_t port_value(const std::string& v, const char* key){
    auto p = parse_port(v);
    if (!p) throw ConfigError(std::string(key) + " must be a valid port number");
    return *p;
}

unsigned ranged(const EnvLookup& env, const char* key, unsigned def, unsigned lo, unsigned hi){
    auto v = env(key);
    if (!v) return def;
    auto n = parse_unsigned(*v);
    if (!n || *n < lo || *n > hi) {
        throw ConfigError(std::string(key) + " must be an integer in [" +
                          std::to_string(lo) + ", " + std::to_string(hi) + "]");
    }
    return static_cast<unsigned>(*n);
}

bool flag(const EnvLookup& env, const char* key, bool def){
    auto v = env(key);
    if (!v) return def;
    auto b = parse_bool(*v);
    if (!b) throw ConfigError(std::string(key) + " must be a boolean (true/false)");
    return *b;
}

} // namespace

std::optional<uint16_t> parse_port(const std::string& s){
    auto n = parse_unsigned(s);
    if (!n || *n > std::numeric_limits<uint16_t>::max()) return std::nullopt;
    return static_cast<uint16_t>(*n);
}

std::optional<bool> parse_bool(const std::string& s){
    std::string v = s;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    return std::nullopt;
}

// Only letters/digits/_ and length <= 64: the name is spliced into SQL.
bool is_valid_table(const std::string& t){
    static const std::regex re("^[A-Za-z0-9_]{1,64}$");
    return std::regex_match(t, re);
}

EnvLookup process_env(){
    return [](const std::string& key) -> std::optional<std::string> {
        const char* v = std::getenv(key.c_str());
        if (!v) return std::nullopt;
        return std::string(v);
    };
}

EnvLookup layered_env(EnvLookup primary, std::map<std::string, std::string> fallback){
    return [primary = std::move(primary), fallback = std::move(fallback)]
           (const std::string& key) -> std::optional<std::string> {
        if (auto v = primary(key)) return v;
        auto it = fallback.find(key);
        if (it == fallback.end()) return std::nullopt;
        return it->second;
    };
}

namespace {

// `"x" # c` and `'x'` give x; unquoted values may carry a trailing ` #` comment.
std::string env_value(const std::string& val){
    if (!val.empty() && (val.front() == '"' || val.front() == '\'')) {
        auto close = val.find(val.front(), 1);
        if (close != std::string::npos) {
            std::string rest = trim(val.substr(close + 1));
            if (rest.empty() || rest[0] == '#') return val.substr(1, close - 1);
        }
    }
    auto hash = val.find(" #");
    if (hash != std::string::npos) return trim(val.substr(0, hash));
    return val;
}

} // namespace

std::map<std::string, std::string> parse_env(std::istream& in){
    std::map<std::string, std::string> out;
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        if (line.rfind("export ", 0) == 0) line = trim(line.substr(7));
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = trim(line.substr(0, eq));
        std::string val = trim(line.substr(eq + 1));
        if (key.empty()) continue;
        out[key] = env_value(val);
    }
    return out;
}

std::map<std::string, std::string> parse_env_file(const std::string& path){
    std::ifstream ifs(path);
    if (!ifs.is_open()) throw ConfigError("cannot read env file: " + path);
    return parse_env(ifs);
}

AppConfig load_config(const EnvLookup& env){
    AppConfig cfg;

    cfg.db.host = require_non_empty(env, "DB_HOST");
    cfg.db.port = port_value(require(env, "DB_PORT"), "DB_PORT");
    cfg.db.database = require_non_empty(env, "DB_NAME");
    cfg.db.user = require_non_empty(env, "DB_USER");
    cfg.db.password = require(env, "DB_PASSWORD");

    if (auto t = env("DB_TABLE")) {
        if (!is_valid_table(*t)) throw ConfigError("DB_TABLE must match [A-Za-z0-9_]{1,64}");
        cfg.db.table = *t;
    }
    cfg.db.pool_size = ranged(env, "DB_POOL_SIZE", cfg.db.pool_size, 1, 64);
    cfg.db.connect_timeout = ranged(env, "DB_CONNECT_TIMEOUT", cfg.db.connect_timeout, 1, 3600);
    cfg.db.tls = flag(env, "DB_TLS", cfg.db.tls);
    cfg.db.trust_server_cert = flag(env, "DB_TRUST_SERVER_CERT", cfg.db.trust_server_cert);
    if (auto ca = env("DB_SSL_CA")) cfg.db.ssl_ca = *ca;
    cfg.db.strict_columns = flag(env, "DB_STRICT_COLUMNS", cfg.db.strict_columns);

    if (auto h = env("HTTP_HOST")) {
        if (h->empty()) throw ConfigError("HTTP_HOST must not be empty");
        cfg.server.host = *h;
    }
    if (auto p = env("HTTP_PORT")) cfg.server.port = port_value(*p, "HTTP_PORT");
    unsigned hw = std::max(1u, std::thread::hardware_concurrency());
    cfg.server.threads = ranged(env, "HTTP_THREADS", hw, 1, 1024);

    if (auto l = env("LOG_LEVEL")) {
        auto lvl = parse_log_level(*l);
        if (!lvl) throw ConfigError("LOG_LEVEL must be one of debug, info, warn, error");
        cfg.log_level = *lvl;
    }
    return cfg;
}

} // namespace usersvc
