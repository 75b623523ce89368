#include "homestead/config.hpp"
#include "homestead/errors.hpp"
#include <cctype>
#include <cstdlib>

namespace homestead {

namespace {

std::string to_lower_copy(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (unsigned char c : input) {
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

}  // namespace

InventoryKind parse_inventory_kind(const std::string& value) {
    const auto lowered = to_lower_copy(value);
    if (lowered == "basic") return InventoryKind::Basic;
    if (lowered == "fancy") return InventoryKind::Fancy;
    throw InvalidArgumentError("Unknown inventory kind: " + value);
}

LogLevel parse_log_level(const std::string& value) {
    const auto lowered = to_lower_copy(value);
    if (lowered == "debug") return LogLevel::Debug;
    if (lowered == "info") return LogLevel::Info;
    if (lowered == "warn") return LogLevel::Warn;
    if (lowered == "error") return LogLevel::Error;
    throw InvalidArgumentError("Unknown log level: " + value);
}

Config Config::from_env() {
    Config config;

    const char* inventory_env = std::getenv(kInventoryEnv);
    if (inventory_env && *inventory_env) {
        config.inventory = parse_inventory_kind(inventory_env);
    }

    const char* level_env = std::getenv(kLogLevelEnv);
    if (level_env && *level_env) {
        config.log_level = parse_log_level(level_env);
    }

    return config;
}

void Config::apply() const {
    set_log_level(log_level);
}

}  // namespace homestead
