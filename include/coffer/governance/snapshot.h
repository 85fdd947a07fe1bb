// COFFER - Pool State Snapshot
// Copyright (c) 2024 COFFER Developers
// MIT License
//
// Binary encoding of PoolState for the host's storage:
//
//   magic "CFR1" | version u32 | members | contributions | balance u64 |
//   totalWeight u64 | quorum | actions | proposals | SHA-256 of all prior bytes
//
// Integers are little-endian, lengths are CompactSize.

#ifndef COFFER_GOVERNANCE_SNAPSHOT_H
#define COFFER_GOVERNANCE_SNAPSHOT_H

#include <coffer/core/types.h>
#include <coffer/governance/pool.h>

#include <optional>
#include <string>
#include <vector>

namespace coffer {
namespace governance {

/// Format version written by EncodeSnapshot
constexpr uint32_t SNAPSHOT_VERSION = 1;

/// Leading bytes of every snapshot
constexpr char SNAPSHOT_MAGIC[4] = {'C', 'F', 'R', '1'};

/// SHA-256 of a buffer
Hash256 SnapshotChecksum(const Byte* data, size_t len);

/// Encode the full pool state
std::vector<Byte> EncodeSnapshot(const PoolState& state);

/**
 * Decode a snapshot.
 *
 * Rejects bad magic, unknown versions, truncated or trailing data, checksum
 * mismatches and states whose ledger invariants do not hold.
 *
 * @param error If non-null, receives the reason on failure
 */
std::optional<PoolState> DecodeSnapshot(const std::vector<Byte>& data,
                                        std::string* error = nullptr);

} // namespace governance
} // namespace coffer

#endif // COFFER_GOVERNANCE_SNAPSHOT_H
