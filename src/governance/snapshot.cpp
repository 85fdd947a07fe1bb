// COFFER - Pool State Snapshot Implementation
// Copyright (c) 2024 COFFER Developers
// MIT License

#include <coffer/governance/snapshot.h>
#include <coffer/core/serialize.h>

#include <openssl/evp.h>

#include <cstring>
#include <ios>
#include <set>
#include <stdexcept>

namespace coffer {
namespace governance {

namespace {

constexpr size_t CHECKSUM_SIZE = Hash256::SIZE;

// ============================================================================
// Writers
// ============================================================================

void WriteQuorum(DataStream& s, const QuorumConfig& quorum) {
    s << quorum.countThreshold;
    s << quorum.weightThresholdPercent;
    s << static_cast<uint8_t>(quorum.mode);
}

void WriteApprovals(DataStream& s, const ApprovalState& approvals) {
    s << approvals.approvedBy;
    s << approvals.count;
    s << approvals.weight;
}

void WriteAction(DataStream& s, const Action& action) {
    s << action.id;
    s << action.payload.target;
    s << action.payload.value;
    s << action.payload.data;
    WriteApprovals(s, action.approvals);
    s << action.executed;
}

void WriteProposal(DataStream& s, const Proposal& proposal) {
    s << proposal.id;
    s << static_cast<uint8_t>(GetProposalKind(proposal.payload));
    if (const auto* add = std::get_if<AddMemberChange>(&proposal.payload)) {
        s << add->member;
    } else if (const auto* remove = std::get_if<RemoveMemberChange>(&proposal.payload)) {
        s << remove->member;
    } else {
        WriteQuorum(s, std::get<ChangeParametersChange>(proposal.payload).config);
    }
    WriteApprovals(s, proposal.approvals);
    s << proposal.executed;
}

// ============================================================================
// Readers (throw std::ios_base::failure)
// ============================================================================

QuorumConfig ReadQuorum(DataStream& s) {
    QuorumConfig quorum;
    uint8_t mode;
    s >> quorum.countThreshold;
    s >> quorum.weightThresholdPercent;
    s >> mode;
    if (mode > static_cast<uint8_t>(QuorumMode::Weight)) {
        throw std::ios_base::failure("unknown quorum mode " + std::to_string(mode));
    }
    quorum.mode = static_cast<QuorumMode>(mode);
    return quorum;
}

ApprovalState ReadApprovals(DataStream& s) {
    ApprovalState approvals;
    s >> approvals.approvedBy;
    s >> approvals.count;
    s >> approvals.weight;
    return approvals;
}

Action ReadAction(DataStream& s) {
    Action action;
    s >> action.id;
    s >> action.payload.target;
    s >> action.payload.value;
    s >> action.payload.data;
    action.approvals = ReadApprovals(s);
    s >> action.executed;
    return action;
}

Proposal ReadProposal(DataStream& s) {
    Proposal proposal;
    uint8_t kind;
    s >> proposal.id;
    s >> kind;
    switch (static_cast<ProposalKind>(kind)) {
        case ProposalKind::AddMember: {
            AddMemberChange change;
            s >> change.member;
            proposal.payload = change;
            break;
        }
        case ProposalKind::RemoveMember: {
            RemoveMemberChange change;
            s >> change.member;
            proposal.payload = change;
            break;
        }
        case ProposalKind::ChangeParameters: {
            ChangeParametersChange change;
            change.config = ReadQuorum(s);
            proposal.payload = change;
            break;
        }
        default:
            throw std::ios_base::failure("unknown proposal kind " + std::to_string(kind));
    }
    proposal.approvals = ReadApprovals(s);
    s >> proposal.executed;
    return proposal;
}

bool Fail(std::string* error, const std::string& reason) {
    if (error) {
        *error = reason;
    }
    return false;
}

} // anonymous namespace

// ============================================================================
// Checksum
// ============================================================================

Hash256 SnapshotChecksum(const Byte* data, size_t len) {
    Hash256 digest;
    unsigned int digestLen = 0;
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    bool ok = ctx != nullptr &&
              EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1 &&
              EVP_DigestUpdate(ctx, data, len) == 1 &&
              EVP_DigestFinal_ex(ctx, digest.data(), &digestLen) == 1;
    EVP_MD_CTX_free(ctx);
    if (!ok || digestLen != Hash256::SIZE) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    return digest;
}

// ============================================================================
// Encode / Decode
// ============================================================================

std::vector<Byte> EncodeSnapshot(const PoolState& state) {
    DataStream s;
    s.Write(SNAPSHOT_MAGIC, sizeof(SNAPSHOT_MAGIC));
    s << SNAPSHOT_VERSION;

    s << state.members.GetMembers();
    s << state.contributions.GetContributions();
    s << state.contributions.GetBalance();
    s << state.contributions.GetTotalWeight();
    WriteQuorum(s, state.quorum);

    WriteCompactSize(s, state.actions.Size());
    for (const auto& action : state.actions.Records()) {
        WriteAction(s, action);
    }
    WriteCompactSize(s, state.proposals.Size());
    for (const auto& proposal : state.proposals.Records()) {
        WriteProposal(s, proposal);
    }

    Hash256 checksum = SnapshotChecksum(s.Data().data(), s.Data().size());
    s << checksum;
    return s.Data();
}

std::optional<PoolState> DecodeSnapshot(const std::vector<Byte>& data, std::string* error) {
    if (data.size() < sizeof(SNAPSHOT_MAGIC) + sizeof(uint32_t) + CHECKSUM_SIZE) {
        Fail(error, "snapshot too short");
        return std::nullopt;
    }
    if (std::memcmp(data.data(), SNAPSHOT_MAGIC, sizeof(SNAPSHOT_MAGIC)) != 0) {
        Fail(error, "bad magic");
        return std::nullopt;
    }

    const size_t bodyLen = data.size() - CHECKSUM_SIZE;
    Hash256 expected = SnapshotChecksum(data.data(), bodyLen);
    if (std::memcmp(expected.data(), data.data() + bodyLen, CHECKSUM_SIZE) != 0) {
        Fail(error, "checksum mismatch");
        return std::nullopt;
    }

    DataStream s(data.data() + sizeof(SNAPSHOT_MAGIC), bodyLen - sizeof(SNAPSHOT_MAGIC));
    PoolState state;
    try {
        uint32_t version;
        s >> version;
        if (version != SNAPSHOT_VERSION) {
            Fail(error, "unsupported version " + std::to_string(version));
            return std::nullopt;
        }

        std::vector<MemberId> members;
        std::map<Address, Amount> contributions;
        Amount balance;
        Amount totalWeight;
        s >> members;
        s >> contributions;
        s >> balance;
        s >> totalWeight;
        state.quorum = ReadQuorum(s);

        std::vector<Action> actions;
        for (uint64_t i = 0, n = ReadCompactSize(s); i < n; ++i) {
            actions.push_back(ReadAction(s));
        }
        std::vector<Proposal> proposals;
        for (uint64_t i = 0, n = ReadCompactSize(s); i < n; ++i) {
            proposals.push_back(ReadProposal(s));
        }

        if (!s.empty()) {
            Fail(error, "trailing data");
            return std::nullopt;
        }

        // Governance may have removed every member, so an empty set is valid here
        std::set<MemberId> unique(members.begin(), members.end());
        if (unique.size() != members.size() || unique.count(MemberId()) > 0) {
            Fail(error, "member list has duplicates or null entries");
            return std::nullopt;
        }
        state.members = MembershipRegistry(members);

        if (!ContributionLedger::Restore(contributions, totalWeight, balance, state.contributions)) {
            Fail(error, "total weight does not match contributions");
            return std::nullopt;
        }
        if (!ActionLog::Restore(std::move(actions), state.actions)) {
            Fail(error, "inconsistent action log");
            return std::nullopt;
        }
        if (!ProposalLog::Restore(std::move(proposals), state.proposals)) {
            Fail(error, "inconsistent proposal log");
            return std::nullopt;
        }
    } catch (const std::ios_base::failure& e) {
        Fail(error, std::string("malformed snapshot: ") + e.what());
        return std::nullopt;
    }

    return state;
}

} // namespace governance
} // namespace coffer
