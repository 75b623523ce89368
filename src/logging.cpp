#include "homestead/logging.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace homestead {

namespace {
LogLevel g_threshold = LogLevel::Info;
}

std::string now_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;
    ss << std::put_time(std::gmtime(&time_t), "%FT%TZ");
    return ss.str();
}

std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
    }
    return "info";
}

void set_log_level(LogLevel level) {
    g_threshold = level;
}

LogLevel log_level() {
    return g_threshold;
}

void log(LogLevel level, const std::string& domain, const std::string& message,
         const nlohmann::json& fields) {
    if (level < g_threshold) return;

    nlohmann::json log_entry = {
        {"level", to_string(level)},
        {"message", message},
        {"domain", domain},
        {"timestamp", now_iso8601()}
    };
    for (auto& [key, value] : fields.items()) {
        log_entry[key] = value;
    }
    std::cout << log_entry.dump() << std::endl;
}

}  // namespace homestead
