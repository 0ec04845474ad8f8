// PRICEFEED - Cross-Asset Conversion
// Copyright (c) 2024 PRICEFEED Developers
// MIT License

#include "pricefeed/oracle/conversion.h"

#include <string>

namespace pricefeed {
namespace oracle {

Result<uint64_t> ConvertAmount(uint64_t amount, Price priceFrom, Price priceTo) {
    if (priceTo == 0) {
        return Fail(OracleError::InvalidPrice, "conversion target price is zero");
    }
    uint64_t product = 0;
    // GCC/Clang checked multiply, as serialize.h relies on __builtin_bswap
    if (__builtin_mul_overflow(amount, priceFrom, &product)) {
        return Fail(OracleError::ArithmeticOverflow,
                    std::to_string(amount) + " * " + std::to_string(priceFrom) +
                    " exceeds 64 bits");
    }
    return product / priceTo;
}

} // namespace oracle
} // namespace pricefeed
