// COFFER - Pool Configuration Loading
// Copyright (c) 2024 COFFER Developers
// MIT License
//
// Reads pool and logging settings from a ConfigManager:
//
//   [pool]
//   members = 0x..., 0x...
//   count_threshold = 2
//   weight_threshold_percent = 50
//   voting_mode = count            # or weight
//
//   [log]
//   level = info
//   file = /var/log/coffer.log
//   categories = governance,treasury

#ifndef COFFER_GOVERNANCE_POOL_CONFIG_H
#define COFFER_GOVERNANCE_POOL_CONFIG_H

#include <coffer/governance/errors.h>
#include <coffer/governance/pool.h>
#include <coffer/util/config.h>
#include <coffer/util/logging.h>

#include <string>
#include <vector>

namespace coffer {
namespace governance {

/// Config section names
constexpr const char* POOL_SECTION = "pool";
constexpr const char* LOG_SECTION = "log";

/**
 * Fill a PoolConfig from the [pool] section.
 *
 * Registers the section's required keys on config before validating it.
 * Fails with INVALID_CONFIG if a required key is missing or malformed, or
 * if the result does not pass PoolConfig::Validate().
 */
OpResult LoadPoolConfig(util::ConfigManager& config, PoolConfig& out);

/**
 * Logging settings from the [log] section.
 */
struct LogSettings {
    util::LogLevel level{util::LogLevel::Info};

    /// Extra file sink; empty for none
    std::string file;

    /// Categories to enable; empty enables all
    std::vector<std::string> categories;
};

/// Fill LogSettings; INVALID_CONFIG on an unknown level
OpResult LoadLogSettings(const util::ConfigManager& config, LogSettings& out);

/// Install the settings on the global logger
void ApplyLogSettings(const LogSettings& settings);

} // namespace governance
} // namespace coffer

#endif // COFFER_GOVERNANCE_POOL_CONFIG_H
