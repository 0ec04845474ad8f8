// PRICEFEED - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 PRICEFEED Developers
// MIT License

#ifndef PRICEFEED_CORE_HEX_H
#define PRICEFEED_CORE_HEX_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <stdexcept>

namespace pricefeed {

// Use uint8_t directly to avoid circular dependency with types.h
using HexByte = uint8_t;

/// Convert bytes to hex string
std::string BytesToHex(const HexByte* data, size_t len);
std::string BytesToHex(const std::vector<HexByte>& data);

/// Convert hex string to bytes; throws std::invalid_argument on bad input
std::vector<HexByte> HexToBytes(const std::string& hex);

/// Check if string is valid, non-empty, even-length hex
bool IsValidHex(const std::string& str);

} // namespace pricefeed

#endif // PRICEFEED_CORE_HEX_H
