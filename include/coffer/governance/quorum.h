// COFFER - Quorum Policy
// Copyright (c) 2024 COFFER Developers
// MIT License
//
// Decides whether an accumulated set of approvals may execute.
//
// Count mode is inclusive:  count >= countThreshold
// Weight mode is strict:    weight > totalWeight * weightThresholdPercent / 100
// (integer division truncates). Thresholds are read at execution time.

#ifndef COFFER_GOVERNANCE_QUORUM_H
#define COFFER_GOVERNANCE_QUORUM_H

#include <coffer/core/types.h>
#include <coffer/governance/errors.h>

#include <cstdint>
#include <optional>
#include <string>

namespace coffer {
namespace governance {

struct ApprovalState;

/// Largest weight threshold accepted at construction
constexpr uint64_t MAX_WEIGHT_THRESHOLD_PERCENT = 100;

/// Voting mode
enum class QuorumMode : uint8_t {
    /// One member, one vote
    Count = 0,

    /// Votes weighted by contributions
    Weight = 1,
};

/// Convert mode to string ("count" / "weight")
const char* QuorumModeToString(QuorumMode mode);

/// Parse mode from string (case-insensitive)
std::optional<QuorumMode> ParseQuorumMode(const std::string& str);

/**
 * Quorum thresholds and active mode.
 *
 * Changed only by an executed ChangeParameters proposal, which does not
 * re-run Validate(): a proposal may install a percent above 100.
 */
struct QuorumConfig {
    uint64_t countThreshold{0};
    uint64_t weightThresholdPercent{0};
    QuorumMode mode{QuorumMode::Count};

    /// Construction-time bounds check (percent in [0,100])
    OpResult Validate() const;

    bool operator==(const QuorumConfig& other) const {
        return countThreshold == other.countThreshold &&
               weightThresholdPercent == other.weightThresholdPercent &&
               mode == other.mode;
    }

    std::string ToString() const;
};

/**
 * Weight that approvals must strictly exceed:
 * floor(totalWeight * percent / 100).
 *
 * Returns nullopt if the product does not fit in an Amount, in which case
 * no approval weight can pass.
 */
std::optional<Amount> WeightThreshold(Amount totalWeight, uint64_t percent);

/// Pure quorum decision
bool QuorumPasses(uint64_t approvalCount, Amount approvalWeight,
                  Amount totalWeight, const QuorumConfig& config);

/// Quorum decision for a record's approvals
bool QuorumPasses(const ApprovalState& approvals, Amount totalWeight,
                  const QuorumConfig& config);

} // namespace governance
} // namespace coffer

#endif // COFFER_GOVERNANCE_QUORUM_H
