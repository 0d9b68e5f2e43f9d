#pragma once
/**
 * @file logger.h
 * @brief Leveled stderr logging.
 *
 * LOGD/LOGI/LOGW/LOGE take a printf format; lines below the current
 * threshold (set_log_level) are skipped before formatting.
 */
#include <cstdio>
#include <ctime>
#include <optional>
#include <string>

namespace usersvc {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

void set_log_level(LogLevel level);
LogLevel log_level();
bool log_enabled(LogLevel level);

/// Accepts debug/info/warn/warning/error, case-insensitive.
std::optional<LogLevel> parse_log_level(const std::string& s);

inline std::string now_ts(){
    char buf[32];
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

} // namespace usersvc

#define USERSVC_LOG(lvl, tag, fmt, ...) \
    do { \
        if (::usersvc::log_enabled(lvl)) \
            std::fprintf(stderr, "[%s][" tag "] " fmt "\n", ::usersvc::now_ts().c_str(), ##__VA_ARGS__); \
    } while (0)

#define LOGD(fmt, ...) USERSVC_LOG(::usersvc::LogLevel::Debug, "DEBUG", fmt, ##__VA_ARGS__)
#define LOGI(fmt, ...) USERSVC_LOG(::usersvc::LogLevel::Info,  "INFO ", fmt, ##__VA_ARGS__)
#define LOGW(fmt, ...) USERSVC_LOG(::usersvc::LogLevel::Warn,  "WARN ", fmt, ##__VA_ARGS__)
#define LOGE(fmt, ...) USERSVC_LOG(::usersvc::LogLevel::Error, "ERROR", fmt, ##__VA_ARGS__)
