/**
 * @file logger.cpp
 * @brief Process-wide log threshold.
 */
#include "usersvc/app/logger.h"

#include <algorithm>
#include <atomic>
#include <cctype>

namespace usersvc {

namespace {
std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
}

void set_log_level(LogLevel level){
    g_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel log_level(){
    return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

bool log_enabled(LogLevel level){
    return static_cast<int>(level) >= g_level.load(std::memory_order_relaxed);
}

std::optional<LogLevel> parse_log_level(const std::string& s){
    std::string v = s;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    if (v == "debug") return LogLevel::Debug;
    if (v == "info") return LogLevel::Info;
    if (v == "warn" || v == "warning") return LogLevel::Warn;
    if (v == "error") return LogLevel::Error;
    return std::nullopt;
}

} // namespace usersvc
