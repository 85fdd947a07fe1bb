// COFFER - Action Registry
// Copyright (c) 2024 COFFER Developers
// MIT License
//
// Disbursement requests and the external effect that pays them out.

#ifndef COFFER_GOVERNANCE_ACTION_H
#define COFFER_GOVERNANCE_ACTION_H

#include <coffer/core/types.h>
#include <coffer/governance/errors.h>
#include <coffer/governance/record.h>

#include <functional>
#include <string>
#include <vector>

namespace coffer {
namespace governance {

/**
 * Immutable part of an action: pay value to target with an opaque payload.
 */
struct ActionPayload {
    /// Recipient of the disbursement
    Address target;

    /// Amount moved out of the pool balance
    Amount value{0};

    /// Opaque call data handed to the effect
    std::vector<Byte> data;

    bool operator==(const ActionPayload& other) const {
        return target == other.target && value == other.value && data == other.data;
    }

    std::string ToString() const;
};

using Action = Record<ActionPayload>;
using ActionLog = RecordLog<ActionPayload>;

// ============================================================================
// Effect
// ============================================================================

/**
 * External side effect of an executed action.
 *
 * Called synchronously while the engine holds its lock, so an implementation
 * must not call back into the engine. Any non-OK result aborts the execution
 * and leaves the action pending.
 */
class Effect {
public:
    virtual ~Effect() = default;

    virtual OpResult Dispatch(RecordId id, const ActionPayload& payload) = 0;
};

/**
 * Effect backed by a function, for hosts and tests.
 */
class CallbackEffect : public Effect {
public:
    using DispatchFunction = std::function<OpResult(RecordId, const ActionPayload&)>;

    explicit CallbackEffect(DispatchFunction func);

    OpResult Dispatch(RecordId id, const ActionPayload& payload) override;

private:
    DispatchFunction func_;
};

/**
 * Effect that writes each payout to the log and succeeds.
 */
class LoggingPayoutEffect : public Effect {
public:
    OpResult Dispatch(RecordId id, const ActionPayload& payload) override;

    /// Number of payouts dispatched so far
    size_t PayoutCount() const { return payouts_; }

private:
    size_t payouts_{0};
};

} // namespace governance
} // namespace coffer

#endif // COFFER_GOVERNANCE_ACTION_H
