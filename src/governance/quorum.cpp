// COFFER - Quorum Policy Implementation
// Copyright (c) 2024 COFFER Developers
// MIT License

#include <coffer/governance/quorum.h>
#include <coffer/governance/approval.h>

#include <algorithm>
#include <cctype>
#include <sstream>

namespace coffer {
namespace governance {

const char* QuorumModeToString(QuorumMode mode) {
    switch (mode) {
        case QuorumMode::Count: return "count";
        case QuorumMode::Weight: return "weight";
        default: return "unknown";
    }
}

std::optional<QuorumMode> ParseQuorumMode(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "count") return QuorumMode::Count;
    if (lower == "weight") return QuorumMode::Weight;
    return std::nullopt;
}

OpResult QuorumConfig::Validate() const {
    if (weightThresholdPercent > MAX_WEIGHT_THRESHOLD_PERCENT) {
        return OpResult::Failure(GovernanceError::INVALID_CONFIG,
                                 "Weight threshold percent must be in [0,100], got " +
                                 std::to_string(weightThresholdPercent));
    }
    if (mode != QuorumMode::Count && mode != QuorumMode::Weight) {
        return OpResult::Failure(GovernanceError::INVALID_CONFIG, "Unknown quorum mode");
    }
    return OpResult::Success();
}

std::string QuorumConfig::ToString() const {
    std::ostringstream ss;
    ss << "QuorumConfig(mode=" << QuorumModeToString(mode)
       << ", count=" << countThreshold
       << ", weight%=" << weightThresholdPercent << ")";
    return ss.str();
}

std::optional<Amount> WeightThreshold(Amount totalWeight, uint64_t percent) {
    // floor(t * p / 100) == (t / 100) * p + floor((t % 100) * p / 100),
    // evaluated without forming t * p.
    Amount whole;
    Amount part;
    Amount result;
    if (!CheckedMul(totalWeight / 100, percent, whole) ||
        !CheckedMul(totalWeight % 100, percent, part) ||
        !CheckedAdd(whole, part / 100, result)) {
        return std::nullopt;
    }
    return result;
}

bool QuorumPasses(uint64_t approvalCount, Amount approvalWeight,
                  Amount totalWeight, const QuorumConfig& config) {
    if (config.mode == QuorumMode::Count) {
        return approvalCount >= config.countThreshold;
    }

    auto threshold = WeightThreshold(totalWeight, config.weightThresholdPercent);
    if (!threshold) {
        return false;
    }
    return approvalWeight > *threshold;
}

bool QuorumPasses(const ApprovalState& approvals, Amount totalWeight,
                  const QuorumConfig& config) {
    return QuorumPasses(approvals.count, approvals.weight, totalWeight, config);
}

} // namespace governance
} // namespace coffer
