// PRICEFEED - Serialization Header
// Copyright (c) 2024 PRICEFEED Developers
// MIT License
//
// Serialization primitives used for the persisted engine tables.
// All integers are little-endian; strings and vectors carry a CompactSize
// length prefix.

#ifndef PRICEFEED_CORE_SERIALIZE_H
#define PRICEFEED_CORE_SERIALIZE_H

#include "pricefeed/core/types.h"
#include <cstdint>
#include <cstddef>
#include <cstring>
#include <vector>
#include <string>
#include <stdexcept>
#include <ios>
#include <limits>

namespace pricefeed {

// ============================================================================
// Constants
// ============================================================================

/// Maximum size for serialized objects to prevent memory exhaustion
static constexpr uint64_t MAX_SIZE = 0x02000000;  // 32 MB

/// Maximum vector allocation size
static constexpr unsigned int MAX_VECTOR_ALLOCATE = 5000000;

// ============================================================================
// Endianness Helpers (Always Little-Endian for serialization)
// ============================================================================

namespace detail {

inline uint16_t host_to_le16(uint16_t host) {
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    return __builtin_bswap16(host);
#else
    return host;
#endif
}

inline uint32_t host_to_le32(uint32_t host) {
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    return __builtin_bswap32(host);
#else
    return host;
#endif
}

inline uint64_t host_to_le64(uint64_t host) {
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    return __builtin_bswap64(host);
#else
    return host;
#endif
}

inline uint16_t le16_to_host(uint16_t little) { return host_to_le16(little); }
inline uint32_t le32_to_host(uint32_t little) { return host_to_le32(little); }
inline uint64_t le64_to_host(uint64_t little) { return host_to_le64(little); }

} // namespace detail

// ============================================================================
// DataStream - In-memory byte buffer for serialization
// ============================================================================

class DataStream {
public:
    using value_type = uint8_t;
    using size_type = std::size_t;

private:
    std::vector<uint8_t> data_;
    size_type read_pos_ = 0;

public:
    DataStream() = default;

    explicit DataStream(const std::vector<uint8_t>& data) : data_(data), read_pos_(0) {}

    DataStream(const uint8_t* data, size_type len) : data_(data, data + len), read_pos_(0) {}

    /// Returns unread bytes remaining
    size_type size() const noexcept { return data_.size() - read_pos_; }

    bool empty() const noexcept { return size() == 0; }

    /// Get pointer to unread data
    const uint8_t* data() const noexcept { return data_.data() + read_pos_; }

    void Write(const uint8_t* src, size_type len) {
        data_.insert(data_.end(), src, src + len);
    }

    void Write(const char* src, size_type len) {
        Write(reinterpret_cast<const uint8_t*>(src), len);
    }

    void Read(uint8_t* dst, size_type len) {
        if (len > size()) {
            throw std::ios_base::failure("DataStream::Read(): end of data");
        }
        std::memcpy(dst, data_.data() + read_pos_, len);
        read_pos_ += len;
    }

    void Read(char* dst, size_type len) {
        Read(reinterpret_cast<uint8_t*>(dst), len);
    }

    /// Contents as a byte string, for database values and keys
    std::string Str() const {
        return std::string(reinterpret_cast<const char*>(data()), size());
    }

    std::string ToHex() const;

    template<typename T>
    DataStream& operator<<(const T& obj);

    template<typename T>
    DataStream& operator>>(T& obj);
};

// ============================================================================
// Low-Level Serialization Functions
// ============================================================================

template<typename Stream>
inline void ser_writedata8(Stream& s, uint8_t obj) {
    s.Write(&obj, 1);
}

template<typename Stream>
inline void ser_writedata16(Stream& s, uint16_t obj) {
    obj = detail::host_to_le16(obj);
    s.Write(reinterpret_cast<const uint8_t*>(&obj), 2);
}

template<typename Stream>
inline void ser_writedata32(Stream& s, uint32_t obj) {
    obj = detail::host_to_le32(obj);
    s.Write(reinterpret_cast<const uint8_t*>(&obj), 4);
}

template<typename Stream>
inline void ser_writedata64(Stream& s, uint64_t obj) {
    obj = detail::host_to_le64(obj);
    s.Write(reinterpret_cast<const uint8_t*>(&obj), 8);
}

template<typename Stream>
inline uint8_t ser_readdata8(Stream& s) {
    uint8_t obj;
    s.Read(&obj, 1);
    return obj;
}

template<typename Stream>
inline uint16_t ser_readdata16(Stream& s) {
    uint16_t obj;
    s.Read(reinterpret_cast<uint8_t*>(&obj), 2);
    return detail::le16_to_host(obj);
}

template<typename Stream>
inline uint32_t ser_readdata32(Stream& s) {
    uint32_t obj;
    s.Read(reinterpret_cast<uint8_t*>(&obj), 4);
    return detail::le32_to_host(obj);
}

template<typename Stream>
inline uint64_t ser_readdata64(Stream& s) {
    uint64_t obj;
    s.Read(reinterpret_cast<uint8_t*>(&obj), 8);
    return detail::le64_to_host(obj);
}

// ============================================================================
// CompactSize Encoding
// ============================================================================
// Compact Size format:
//   size <  253        -- 1 byte
//   size <= 0xFFFF     -- 3 bytes (0xFD + 2 bytes little-endian)
//   size <= 0xFFFFFFFF -- 5 bytes (0xFE + 4 bytes little-endian)
//   size >  0xFFFFFFFF -- 9 bytes (0xFF + 8 bytes little-endian)

template<typename Stream>
void WriteCompactSize(Stream& s, uint64_t size) {
    if (size < 253) {
        ser_writedata8(s, static_cast<uint8_t>(size));
    } else if (size <= 0xFFFF) {
        ser_writedata8(s, 0xFD);
        ser_writedata16(s, static_cast<uint16_t>(size));
    } else if (size <= 0xFFFFFFFF) {
        ser_writedata8(s, 0xFE);
        ser_writedata32(s, static_cast<uint32_t>(size));
    } else {
        ser_writedata8(s, 0xFF);
        ser_writedata64(s, size);
    }
}

template<typename Stream>
uint64_t ReadCompactSize(Stream& s) {
    uint8_t marker = ser_readdata8(s);
    uint64_t size = 0;

    if (marker < 253) {
        size = marker;
    } else if (marker == 253) {
        size = ser_readdata16(s);
        if (size < 253) {
            throw std::ios_base::failure("non-canonical ReadCompactSize()");
        }
    } else if (marker == 254) {
        size = ser_readdata32(s);
        if (size < 0x10000) {
            throw std::ios_base::failure("non-canonical ReadCompactSize()");
        }
    } else {
        size = ser_readdata64(s);
        if (size < 0x100000000ULL) {
            throw std::ios_base::failure("non-canonical ReadCompactSize()");
        }
    }

    if (size > MAX_SIZE) {
        throw std::ios_base::failure("ReadCompactSize(): size too large");
    }

    return size;
}

// ============================================================================
// Serialize/Unserialize for Basic Types
// ============================================================================

template<typename Stream>
inline void Serialize(Stream& s, uint8_t a) { ser_writedata8(s, a); }

template<typename Stream>
inline void Unserialize(Stream& s, uint8_t& a) { a = ser_readdata8(s); }

template<typename Stream>
inline void Serialize(Stream& s, uint32_t a) { ser_writedata32(s, a); }

template<typename Stream>
inline void Unserialize(Stream& s, uint32_t& a) { a = ser_readdata32(s); }

template<typename Stream>
inline void Serialize(Stream& s, uint64_t a) { ser_writedata64(s, a); }

template<typename Stream>
inline void Unserialize(Stream& s, uint64_t& a) { a = ser_readdata64(s); }

template<typename Stream>
inline void Serialize(Stream& s, bool a) { ser_writedata8(s, a ? 1 : 0); }

template<typename Stream>
inline void Unserialize(Stream& s, bool& a) {
    uint8_t v = ser_readdata8(s);
    if (v > 1) {
        throw std::ios_base::failure("Unserialize(): invalid boolean");
    }
    a = (v != 0);
}

// ============================================================================
// Serialize/Unserialize for Strings
// ============================================================================

template<typename Stream>
void Serialize(Stream& s, const std::string& str) {
    WriteCompactSize(s, str.size());
    if (!str.empty()) {
        s.Write(str.data(), str.size());
    }
}

template<typename Stream>
void Unserialize(Stream& s, std::string& str) {
    uint64_t size = ReadCompactSize(s);
    str.resize(size);
    if (size > 0) {
        s.Read(&str[0], size);
    }
}

// ============================================================================
// Serialize/Unserialize for Hash Types
// ============================================================================

template<typename Stream>
void Serialize(Stream& s, const Hash256& hash) {
    s.Write(hash.data(), Hash256::SIZE);
}

template<typename Stream>
void Unserialize(Stream& s, Hash256& hash) {
    s.Read(hash.data(), Hash256::SIZE);
}

template<typename Stream>
void Serialize(Stream& s, const Hash160& hash) {
    s.Write(hash.data(), Hash160::SIZE);
}

template<typename Stream>
void Unserialize(Stream& s, Hash160& hash) {
    s.Read(hash.data(), Hash160::SIZE);
}

// ============================================================================
// Serialize/Unserialize for Vectors
// ============================================================================

template<typename Stream, typename T>
void Serialize(Stream& s, const std::vector<T>& v) {
    WriteCompactSize(s, v.size());
    for (const auto& item : v) {
        Serialize(s, item);
    }
}

template<typename Stream, typename T>
void Unserialize(Stream& s, std::vector<T>& v) {
    uint64_t size = ReadCompactSize(s);
    v.clear();
    v.reserve(std::min(size, static_cast<uint64_t>(MAX_VECTOR_ALLOCATE / sizeof(T))));
    for (uint64_t i = 0; i < size; ++i) {
        T item;
        Unserialize(s, item);
        v.push_back(std::move(item));
    }
}

// ============================================================================
// DataStream Stream Operators Implementation
// ============================================================================

template<typename T>
DataStream& DataStream::operator<<(const T& obj) {
    Serialize(*this, obj);
    return *this;
}

template<typename T>
DataStream& DataStream::operator>>(T& obj) {
    Unserialize(*this, obj);
    return *this;
}

} // namespace pricefeed

#endif // PRICEFEED_CORE_SERIALIZE_H
