// COFFER - Core Types Header
// Copyright (c) 2024 COFFER Developers
// MIT License
//
// This file defines fundamental types used throughout COFFER.

#ifndef COFFER_CORE_TYPES_H
#define COFFER_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <optional>
#include <limits>
#include <cstring>

namespace coffer {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Amount in smallest units. Unsigned: balances and weights never go negative.
using Amount = uint64_t;

/// Largest representable amount
constexpr Amount MAX_AMOUNT = std::numeric_limits<Amount>::max();

/// Position of a record in an append-only log
using RecordId = uint64_t;

// ============================================================================
// Checked Arithmetic
// ============================================================================

/// Add two amounts. Returns false (and leaves out untouched) on overflow.
inline bool CheckedAdd(Amount a, Amount b, Amount& out) {
    if (b > MAX_AMOUNT - a) {
        return false;
    }
    out = a + b;
    return true;
}

/// Subtract b from a. Returns false (and leaves out untouched) on underflow.
inline bool CheckedSub(Amount a, Amount b, Amount& out) {
    if (b > a) {
        return false;
    }
    out = a - b;
    return true;
}

/// Multiply two amounts. Returns false (and leaves out untouched) on overflow.
inline bool CheckedMul(Amount a, Amount b, Amount& out) {
    if (a != 0 && b > MAX_AMOUNT / a) {
        return false;
    }
    out = a * b;
    return true;
}

// ============================================================================
// Hash Templates
// ============================================================================

/// Fixed-size opaque byte string
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;

    /// Default constructor - creates null hash
    BaseHash() noexcept {
        data_.fill(0);
    }

    /// Construct from byte array
    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    /// Construct from raw bytes (zero-padded if short)
    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, len < SIZE ? len : SIZE);
        }
    }

    /// Check if all bytes are zero
    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    const Byte* begin() const noexcept { return data_.data(); }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const BaseHash& other) const noexcept {
        return data_ < other.data_;
    }

    /// Lowercase hex in storage order
    std::string ToHex() const;

protected:
    std::array<Byte, SIZE> data_;
};

/// 256-bit digest (32 bytes)
class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;
};

/// 160-bit identifier (20 bytes)
class Hash160 : public BaseHash<160> {
public:
    using BaseHash<160>::BaseHash;
};

// ============================================================================
// Principals
// ============================================================================

/// Opaque principal id: members, depositors and action targets.
using Address = Hash160;

/// A pool member is identified by its principal address
using MemberId = Address;

/// Format an address as "0x" followed by 40 lowercase hex digits
std::string FormatAddress(const Address& addr);

/// Parse "0x..." (or bare) 40 hex digit address
std::optional<Address> ParseAddress(const std::string& str);

/// Format an amount for display
std::string FormatAmount(Amount amount);

} // namespace coffer

#endif // COFFER_CORE_TYPES_H
