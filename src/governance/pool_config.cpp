// COFFER - Pool Configuration Loading Implementation
// Copyright (c) 2024 COFFER Developers
// MIT License

#include <coffer/governance/pool_config.h>

#include <algorithm>
#include <cctype>
#include <memory>

namespace coffer {
namespace governance {

namespace {

OpResult Invalid(const std::string& message) {
    return OpResult::Failure(GovernanceError::INVALID_CONFIG, message);
}

bool IsKnownLogLevel(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower == "trace" || lower == "debug" || lower == "info" || lower == "warn" ||
           lower == "warning" || lower == "error" || lower == "fatal" || lower == "off";
}

} // anonymous namespace

OpResult LoadPoolConfig(util::ConfigManager& config, PoolConfig& out) {
    config.RequireKey("members", POOL_SECTION);
    config.RequireKey("count_threshold", POOL_SECTION);
    config.RequireKey("weight_threshold_percent", POOL_SECTION);
    auto missing = config.Validate();
    if (!missing.empty()) {
        std::string message = missing.front();
        for (size_t i = 1; i < missing.size(); ++i) {
            message += "; " + missing[i];
        }
        return Invalid(message);
    }

    PoolConfig result;
    for (const auto& item : config.GetList("members", POOL_SECTION)) {
        auto member = ParseAddress(item);
        if (!member) {
            return Invalid("Invalid member address: " + item);
        }
        result.members.push_back(*member);
    }

    auto count = config.TryGetUInt("count_threshold", POOL_SECTION);
    if (!count) {
        return Invalid("pool:count_threshold must be a non-negative integer");
    }
    result.quorum.countThreshold = *count;

    auto percent = config.TryGetUInt("weight_threshold_percent", POOL_SECTION);
    if (!percent) {
        return Invalid("pool:weight_threshold_percent must be a non-negative integer");
    }
    result.quorum.weightThresholdPercent = *percent;

    std::string modeName = config.GetString("voting_mode", "count", POOL_SECTION);
    auto mode = ParseQuorumMode(modeName);
    if (!mode) {
        return Invalid("pool:voting_mode must be 'count' or 'weight', got '" + modeName + "'");
    }
    result.quorum.mode = *mode;

    auto valid = result.Validate();
    if (!valid) {
        return valid;
    }

    out = std::move(result);
    LOG_DEBUG(util::LogCategory::CONFIG) << "Loaded pool config: " << out.members.size()
                                         << " members, " << out.quorum.ToString();
    return OpResult::Success();
}

OpResult LoadLogSettings(const util::ConfigManager& config, LogSettings& out) {
    LogSettings result;

    if (auto level = config.TryGetString("level", LOG_SECTION)) {
        if (!IsKnownLogLevel(*level)) {
            return Invalid("Unknown log level: " + *level);
        }
        result.level = util::LogLevelFromString(*level);
    }
    result.file = config.GetString("file", "", LOG_SECTION);
    result.categories = config.GetList("categories", LOG_SECTION);

    out = std::move(result);
    return OpResult::Success();
}

void ApplyLogSettings(const LogSettings& settings) {
    auto& logger = util::Logger::Instance();
    logger.SetLevel(settings.level);

    if (!settings.file.empty()) {
        auto sink = std::make_shared<util::FileSink>(settings.file, settings.level);
        if (sink->IsOpen()) {
            logger.AddSink(sink);
        } else {
            LOG_WARN(util::LogCategory::CONFIG) << "Cannot open log file: " << settings.file;
        }
    }

    if (settings.categories.empty()) {
        logger.EnableAllCategories();
    } else {
        for (const auto& category : settings.categories) {
            logger.EnableCategory(category);
        }
    }
}

} // namespace governance
} // namespace coffer
