// COFFER - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 COFFER Developers
// MIT License

#ifndef COFFER_CORE_HEX_H
#define COFFER_CORE_HEX_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace coffer {

/// Convert bytes to lowercase hex string
std::string BytesToHex(const uint8_t* data, size_t len);
std::string BytesToHex(const std::vector<uint8_t>& data);

/// Convert hex string to bytes. An optional "0x" prefix is accepted.
/// @throws std::invalid_argument on odd length or non-hex characters
std::vector<uint8_t> HexToBytes(const std::string& hex);

/// Check if string is valid hex (optional "0x" prefix, even length, may be empty after prefix)
bool IsValidHex(const std::string& str);

/// Strip a leading "0x"/"0X" if present
std::string StripHexPrefix(const std::string& str);

} // namespace coffer

#endif // COFFER_CORE_HEX_H
