// PRICEFEED - Cross-Asset Conversion
// Copyright (c) 2024 PRICEFEED Developers
// MIT License

#ifndef PRICEFEED_ORACLE_CONVERSION_H
#define PRICEFEED_ORACLE_CONVERSION_H

#include "pricefeed/core/types.h"
#include "pricefeed/oracle/errors.h"

#include <cstdint>

namespace pricefeed {
namespace oracle {

/**
 * amount * priceFrom / priceTo, truncating.
 * ArithmeticOverflow if the product exceeds 64 bits; InvalidPrice if priceTo is 0.
 */
Result<uint64_t> ConvertAmount(uint64_t amount, Price priceFrom, Price priceTo);

} // namespace oracle
} // namespace pricefeed

#endif // PRICEFEED_ORACLE_CONVERSION_H
