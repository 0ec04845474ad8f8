// PRICEFEED - Core Types Implementation
// Copyright (c) 2024 PRICEFEED Developers
// MIT License

#include "pricefeed/core/types.h"
#include "pricefeed/core/hex.h"

namespace pricefeed {

// ============================================================================
// BaseHash Implementation
// ============================================================================

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    return BytesToHex(data_.data(), SIZE);
}

template<size_t BITS>
BaseHash<BITS> BaseHash<BITS>::FromHex(const std::string& hex) {
    if (hex.length() != SIZE * 2) {
        throw std::invalid_argument("Invalid hex string length for hash");
    }

    std::vector<HexByte> bytes = HexToBytes(hex);
    return BaseHash(bytes.data(), bytes.size());
}

// Explicit template instantiations
template class BaseHash<256>;
template class BaseHash<160>;

// ============================================================================
// Principal Parsing
// ============================================================================

bool ParsePrincipal(const std::string& hex, Principal& out) {
    if (hex.length() != Principal::SIZE * 2 || !IsValidHex(hex)) {
        return false;
    }
    out = Principal::FromHex(hex);
    return true;
}

} // namespace pricefeed
