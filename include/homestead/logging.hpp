#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace homestead {

enum class LogLevel { Debug, Info, Warn, Error };

std::string now_iso8601();

std::string to_string(LogLevel level);

/// Entries below this level are dropped. Defaults to Info.
void set_log_level(LogLevel level);
LogLevel log_level();

/// Write one JSON line: level, message, domain, timestamp plus `fields`.
void log(LogLevel level, const std::string& domain, const std::string& message,
         const nlohmann::json& fields = {});

inline void log_debug(const std::string& domain, const std::string& message,
                      const nlohmann::json& fields = {}) {
    log(LogLevel::Debug, domain, message, fields);
}

inline void log_info(const std::string& domain, const std::string& message,
                     const nlohmann::json& fields = {}) {
    log(LogLevel::Info, domain, message, fields);
}

inline void log_warn(const std::string& domain, const std::string& message,
                     const nlohmann::json& fields = {}) {
    log(LogLevel::Warn, domain, message, fields);
}

inline void log_error(const std::string& domain, const std::string& message,
                      const nlohmann::json& fields = {}) {
    log(LogLevel::Error, domain, message, fields);
}

}  // namespace homestead
