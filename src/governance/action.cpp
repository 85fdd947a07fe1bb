// COFFER - Action Registry Implementation
// Copyright (c) 2024 COFFER Developers
// MIT License

#include <coffer/governance/action.h>
#include <coffer/core/hex.h>
#include <coffer/util/logging.h>

#include <sstream>

namespace coffer {
namespace governance {

std::string ActionPayload::ToString() const {
    std::ostringstream ss;
    ss << "Action(target=" << FormatAddress(target)
       << ", value=" << FormatAmount(value)
       << ", data=0x" << BytesToHex(data) << ")";
    return ss.str();
}

CallbackEffect::CallbackEffect(DispatchFunction func)
    : func_(std::move(func)) {}

OpResult CallbackEffect::Dispatch(RecordId id, const ActionPayload& payload) {
    if (!func_) {
        return OpResult::Failure(GovernanceError::EFFECT_DISPATCH_FAILED,
                                 "No dispatch function installed");
    }
    return func_(id, payload);
}

OpResult LoggingPayoutEffect::Dispatch(RecordId id, const ActionPayload& payload) {
    ++payouts_;
    LOG_INFO(util::LogCategory::EFFECT) << "Payout for action " << id << ": "
                                        << FormatAmount(payload.value) << " to "
                                        << FormatAddress(payload.target)
                                        << " (" << payload.data.size() << " bytes data)";
    return OpResult::Success();
}

} // namespace governance
} // namespace coffer
