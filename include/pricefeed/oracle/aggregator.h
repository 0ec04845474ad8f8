// PRICEFEED - Price Aggregation
// Copyright (c) 2024 PRICEFEED Developers
// MIT License
//
// Combines the active, fresh quotes of an asset into one weighted average:
//
//     aggregate = sum(price * weight) / sum(weight)    (truncating)
//
// Quotes are summed in source registration order.

#ifndef PRICEFEED_ORACLE_AGGREGATOR_H
#define PRICEFEED_ORACLE_AGGREGATOR_H

#include "pricefeed/core/types.h"
#include "pricefeed/oracle/errors.h"
#include "pricefeed/oracle/quote_store.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace pricefeed {
namespace oracle {

// ============================================================================
// Constants
// ============================================================================

constexpr uint64_t DEFAULT_MIN_SOURCES = 1;
constexpr Height DEFAULT_STALENESS_THRESHOLD = 120;

// ============================================================================
// Aggregate Price
// ============================================================================

struct AggregatePrice {
    Price price{0};
    Height lastUpdateHeight{0};

    /// Number of quotes summed
    uint32_t sourceCount{0};

    bool operator==(const AggregatePrice& other) const {
        return price == other.price && lastUpdateHeight == other.lastUpdateHeight &&
               sourceCount == other.sourceCount;
    }

    std::string ToString() const;
};

/// Owner-controlled aggregation parameters
struct AggregationParams {
    uint64_t minSources{DEFAULT_MIN_SOURCES};
    Height stalenessThreshold{DEFAULT_STALENESS_THRESHOLD};
};

// ============================================================================
// Aggregate Cache
// ============================================================================

/// Last computed aggregate per asset; entries are overwritten, never removed
class AggregateCache {
public:
    std::optional<AggregatePrice> Get(const std::string& asset) const;
    void Put(const std::string& asset, const AggregatePrice& aggregate);

    const std::map<std::string, AggregatePrice>& Entries() const { return entries_; }
    void Clear() { entries_.clear(); }

private:
    std::map<std::string, AggregatePrice> entries_;
};

// ============================================================================
// Price Aggregator
// ============================================================================

class PriceAggregator {
public:
    /**
     * Weighted average of the active quotes in book that are fresh at `now`.
     *
     * @return InsufficientSources if fewer than params.minSources quotes
     *         qualify, ArithmeticOverflow if a sum exceeds 64 bits
     */
    static Result<AggregatePrice> Aggregate(const std::string& asset,
                                            const AssetBook& book,
                                            Height now,
                                            const AggregationParams& params);
};

} // namespace oracle
} // namespace pricefeed

#endif // PRICEFEED_ORACLE_AGGREGATOR_H
