// PRICEFEED - Serialization Implementation
// Copyright (c) 2024 PRICEFEED Developers
// MIT License

#include "pricefeed/core/serialize.h"
#include "pricefeed/core/hex.h"

namespace pricefeed {

std::string DataStream::ToHex() const {
    return BytesToHex(data(), size());
}

} // namespace pricefeed
