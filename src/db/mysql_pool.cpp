/**
 * @file mysql_pool.cpp
 * @brief MySQL connection setup and pool construction.
 */
#include "usersvc/db/mysql_pool.h"
#include "usersvc/app/errors.h"
#include "usersvc/app/logger.h"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstring>
#include <mutex>
#include <vector>

namespace usersvc {

namespace {

std::once_flag g_library_once;

void library_init(){
    std::call_once(g_library_once, []{
        if (mysql_library_init(0, nullptr, nullptr) != 0)
            throw ConnectError("mysql_library_init failed");
    });
}

void set_option(MYSQL* c, mysql_option opt, const void* arg, const char* what){
    if (mysql_options(c, opt, arg) != 0)
        throw ConnectError(std::string("mysql_options(") + what + ") failed: " + mysql_error(c));
}

struct ThreadAttachment {
    ThreadAttachment() { mysql_thread_init(); }
    ~ThreadAttachment() { mysql_thread_end(); }
};

} // namespace

std::string resolve_host(const std::string& host, uint16_t port){
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* res = nullptr;
    std::string service = std::to_string(port);
    int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
    if (rc != 0 || !res) {
        throw ConnectError("cannot resolve " + host + ": " + gai_strerror(rc));
    }
    char buf[INET6_ADDRSTRLEN] = {0};
    const void* addr = nullptr;
    if (res->ai_family == AF_INET) addr = &reinterpret_cast<sockaddr_in*>(res->ai_addr)->sin_addr;
    else addr = &reinterpret_cast<sockaddr_in6*>(res->ai_addr)->sin6_addr;
    const char* out = ::inet_ntop(res->ai_family, addr, buf, sizeof(buf));
    ::freeaddrinfo(res);
    if (!out) throw ConnectError("cannot format address of " + host);
    return buf;
}

void mysql_thread_attach(){
    thread_local ThreadAttachment attachment;
    (void)attachment;
}

MySqlConnection::MySqlConnection() : conn_(nullptr) {}
MySqlConnection::~MySqlConnection() { close(); }

void MySqlConnection::open(const DbConfig& cfg){
    close();
    library_init();

    std::string addr = resolve_host(cfg.host, cfg.port);
    LOGI("Connecting to MySQL at %s:%u database: %s", cfg.host.c_str(), (unsigned)cfg.port, cfg.database.c_str());
    LOGD("%s resolved to %s", cfg.host.c_str(), addr.c_str());

    conn_ = mysql_init(nullptr);
    if (!conn_) throw ConnectError("mysql_init failed");

    try {
        unsigned int protocol = MYSQL_PROTOCOL_TCP;
        unsigned int timeout = cfg.connect_timeout;
        set_option(conn_, MYSQL_OPT_PROTOCOL, &protocol, "protocol");
        set_option(conn_, MYSQL_OPT_CONNECT_TIMEOUT, &timeout, "connect_timeout");
        set_option(conn_, MYSQL_SET_CHARSET_NAME, "utf8mb4", "charset");

        unsigned int ssl_mode = SSL_MODE_DISABLED;
        if (cfg.tls) ssl_mode = cfg.trust_server_cert ? SSL_MODE_REQUIRED : SSL_MODE_VERIFY_IDENTITY;
        set_option(conn_, MYSQL_OPT_SSL_MODE, &ssl_mode, "ssl_mode");
        if (cfg.tls && !cfg.ssl_ca.empty())
            set_option(conn_, MYSQL_OPT_SSL_CA, cfg.ssl_ca.c_str(), "ssl_ca");

        if (!mysql_real_connect(conn_, cfg.host.c_str(), cfg.user.c_str(), cfg.password.c_str(),
                                cfg.database.c_str(), cfg.port, nullptr, 0)) {
            throw ConnectError(std::string("MySQL connect failed: ") + mysql_error(conn_));
        }
    } catch (...) {
        close();
        throw;
    }

    // net.fd is part of libmysqlclient's MYSQL layout; other client libraries may differ.
    int one = 1;
    if (::setsockopt(conn_->net.fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one)) != 0) {
        LOGW("TCP_NODELAY not set: %s", std::strerror(errno));
    }
    LOGI("Successfully connected to MySQL database");
}

void MySqlConnection::close(){
    if (conn_) { mysql_close(conn_); conn_ = nullptr; }
}

MYSQL* MySqlConnection::raw() { return conn_; }

MySqlConnection::Result MySqlConnection::run_query(const std::string& sql){
    mysql_thread_attach();
    if (mysql_real_query(conn_, sql.data(), (unsigned long)sql.size()) != 0) {
        throw QueryError(std::string("DB error: ") + mysql_error(conn_));
    }
    LOGI("Query executed successfully");

    Result res(mysql_store_result(conn_));
    if (!res) {
        if (mysql_errno(conn_) != 0) throw FetchError(std::string("Failed to fetch rows: ") + mysql_error(conn_));
        throw FetchError("statement returned no result set");
    }
    return res;
}

std::unique_ptr<MySqlPool> make_mysql_pool(const DbConfig& cfg){
    if (cfg.tls && cfg.trust_server_cert) {
        LOGW("DB_TRUST_SERVER_CERT is set: server certificate will NOT be verified");
    } else if (!cfg.tls) {
        LOGW("DB_TLS is off: database traffic is unencrypted");
    }

    std::vector<std::unique_ptr<MySqlConnection>> conns;
    conns.reserve(cfg.pool_size);
    for (unsigned i = 0; i < cfg.pool_size; ++i) {
        auto c = std::make_unique<MySqlConnection>();
        c->open(cfg);
        conns.push_back(std::move(c));
    }
    LOGI("MySQL pool ready: %u", cfg.pool_size);
    return std::make_unique<MySqlPool>(std::move(conns));
}

} // namespace usersvc
