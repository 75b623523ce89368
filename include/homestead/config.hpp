#pragma once

#include <string>
#include "homestead/inventory.hpp"
#include "homestead/logging.hpp"

namespace homestead {

constexpr const char* kInventoryEnv = "HOMESTEAD_INVENTORY";
constexpr const char* kLogLevelEnv = "HOMESTEAD_LOG_LEVEL";

/**
 * Runtime settings, read from the environment.
 *
 *   HOMESTEAD_INVENTORY  basic | fancy              (default fancy)
 *   HOMESTEAD_LOG_LEVEL  debug | info | warn | error (default info)
 */
struct Config {
    InventoryKind inventory = InventoryKind::Fancy;
    LogLevel log_level = LogLevel::Info;

    /**
     * @throws InvalidArgumentError on an unrecognised value
     */
    static Config from_env();

    /// Install log_level as the process-wide logging threshold.
    void apply() const;
};

/// @throws InvalidArgumentError unless value is "basic" or "fancy"
InventoryKind parse_inventory_kind(const std::string& value);

/// @throws InvalidArgumentError unless value is "debug", "info", "warn" or "error"
LogLevel parse_log_level(const std::string& value);

}  // namespace homestead
