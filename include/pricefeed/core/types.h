// PRICEFEED - Core Types Header
// Copyright (c) 2024 PRICEFEED Developers
// MIT License
//
// This file defines fundamental types used throughout PRICEFEED.

#ifndef PRICEFEED_CORE_TYPES_H
#define PRICEFEED_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <string>
#include <algorithm>
#include <stdexcept>
#include <cstring>

namespace pricefeed {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Monotonic height supplied by the execution environment
using Height = uint64_t;

/// Price in the asset's smallest quoted unit
using Price = uint64_t;

/// Relative influence of a quote in the weighted average
using Weight = uint32_t;

// ============================================================================
// Hash Templates
// ============================================================================

/// Generic fixed-width identifier
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

    /// Construct from raw bytes
    BaseHash(const Byte* data, size_t len) noexcept {
        if (len >= SIZE) {
            std::memcpy(data_.data(), data, SIZE);
        } else {
            data_.fill(0);
            if (data && len > 0) {
                std::memcpy(data_.data(), data, len);
            }
        }
    }

    /// Check if hash is all zeros
    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    void SetNull() noexcept {
        data_.fill(0);
    }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    Byte* begin() noexcept { return data_.data(); }
    const Byte* begin() const noexcept { return data_.data(); }
    Byte* end() noexcept { return data_.data() + SIZE; }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }

    /// Lexicographic byte order, so map iteration follows ToHex() order
    bool operator<(const BaseHash& other) const noexcept {
        return data_ < other.data_;
    }

    /// Convert to lowercase hex string (storage byte order)
    std::string ToHex() const;

    /// Parse from hex string; throws std::invalid_argument on bad input
    static BaseHash FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

// ============================================================================
// Specific Hash Types
// ============================================================================

/// 256-bit hash (32 bytes)
class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;

    static Hash256 FromHex(const std::string& hex) {
        return Hash256(BaseHash<256>::FromHex(hex).data(), SIZE);
    }
};

/// 160-bit hash (20 bytes) - principal identities
class Hash160 : public BaseHash<160> {
public:
    using BaseHash<160>::BaseHash;

    static Hash160 FromHex(const std::string& hex) {
        auto base = BaseHash<160>::FromHex(hex);
        return Hash160(base.data(), SIZE);
    }
};

/// Caller identity (owner, reporter) as delivered by the environment
using Principal = Hash160;

/// Parse a principal from 40 hex characters; false on malformed input
bool ParsePrincipal(const std::string& hex, Principal& out);

} // namespace pricefeed

#endif // PRICEFEED_CORE_TYPES_H
