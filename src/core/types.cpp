// COFFER - Core Types Implementation
// Copyright (c) 2024 COFFER Developers
// MIT License

#include "coffer/core/types.h"
#include "coffer/core/hex.h"

namespace coffer {

// ============================================================================
// BaseHash Implementation
// ============================================================================

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    return BytesToHex(data_.data(), SIZE);
}

// Explicit template instantiations
template class BaseHash<256>;
template class BaseHash<160>;

// ============================================================================
// Address Helpers
// ============================================================================

std::string FormatAddress(const Address& addr) {
    return "0x" + addr.ToHex();
}

std::optional<Address> ParseAddress(const std::string& str) {
    std::string hex = StripHexPrefix(str);
    if (hex.length() != Address::SIZE * 2 || !IsValidHex(hex)) {
        return std::nullopt;
    }
    auto bytes = HexToBytes(hex);
    return Address(bytes.data(), bytes.size());
}

std::string FormatAmount(Amount amount) {
    return std::to_string(amount);
}

} // namespace coffer
