// COFFER - Append-only Record Log
// Copyright (c) 2024 COFFER Developers
// MIT License
//
// Records addressed by position. Payloads are fixed at submission; only the
// approval state and the executed flag change afterwards, and an executed
// record never changes again.

#ifndef COFFER_GOVERNANCE_RECORD_H
#define COFFER_GOVERNANCE_RECORD_H

#include <coffer/core/types.h>
#include <coffer/governance/approval.h>
#include <coffer/governance/errors.h>

#include <string>
#include <utility>
#include <vector>

namespace coffer {
namespace governance {

/**
 * One entry of a record log.
 */
template<typename Payload>
struct Record {
    RecordId id{0};
    Payload payload;
    ApprovalState approvals;
    bool executed{false};
};

/**
 * Append-only log of records of one kind, with the approval mechanics.
 */
template<typename Payload>
class RecordLog {
public:
    using RecordType = Record<Payload>;

    /// Append a record; its id is its position
    RecordId Append(Payload payload) {
        RecordType record;
        record.id = records_.size();
        record.payload = std::move(payload);
        records_.push_back(std::move(record));
        return records_.back().id;
    }

    size_t Size() const { return records_.size(); }

    bool Contains(RecordId id) const { return id < records_.size(); }

    const RecordType* Find(RecordId id) const {
        return Contains(id) ? &records_[id] : nullptr;
    }

    const std::vector<RecordType>& Records() const { return records_; }

    OpResult Approve(RecordId id, const MemberId& voter, bool voterIsMember, Amount voterWeight) {
        if (!Contains(id)) {
            return NotFound(id);
        }
        RecordType& record = records_[id];
        return ApplyApproval(record.approvals, record.executed, voter, voterIsMember, voterWeight);
    }

    OpResult Revoke(RecordId id, const MemberId& voter) {
        if (!Contains(id)) {
            return NotFound(id);
        }
        RecordType& record = records_[id];
        return ApplyRevocation(record.approvals, record.executed, voter);
    }

    /// NOT_FOUND or ALREADY_EXECUTED, else OK
    OpResult CheckPending(RecordId id) const {
        if (!Contains(id)) {
            return NotFound(id);
        }
        if (records_[id].executed) {
            return OpResult::Failure(GovernanceError::ALREADY_EXECUTED);
        }
        return OpResult::Success();
    }

    /// Set the terminal flag; caller has checked CheckPending()
    void MarkExecuted(RecordId id) { records_[id].executed = true; }

    /// Clear the flag again when the execution it belonged to is rolled back
    void UnmarkExecuted(RecordId id) { records_[id].executed = false; }

    /**
     * Rebuild a log from stored records.
     * Returns false if ids are not 0..n-1 in order or any approval state is
     * inconsistent.
     */
    static bool Restore(std::vector<RecordType> records, RecordLog& out) {
        for (size_t i = 0; i < records.size(); ++i) {
            if (records[i].id != i || !records[i].approvals.IsConsistent()) {
                return false;
            }
        }
        out.records_ = std::move(records);
        return true;
    }

private:
    static OpResult NotFound(RecordId id) {
        return OpResult::Failure(GovernanceError::NOT_FOUND,
                                 "Record " + std::to_string(id) + " does not exist");
    }

    std::vector<RecordType> records_;
};

} // namespace governance
} // namespace coffer

#endif // COFFER_GOVERNANCE_RECORD_H
