// PRICEFEED - Price Aggregation
// Copyright (c) 2024 PRICEFEED Developers
// MIT License

#include "pricefeed/oracle/aggregator.h"
#include "pricefeed/oracle/staleness.h"

#include <sstream>

namespace pricefeed {
namespace oracle {

std::string AggregatePrice::ToString() const {
    std::ostringstream ss;
    ss << "AggregatePrice(price=" << price
       << ", lastUpdateHeight=" << lastUpdateHeight
       << ", sourceCount=" << sourceCount << ")";
    return ss.str();
}

// ============================================================================
// AggregateCache
// ============================================================================

std::optional<AggregatePrice> AggregateCache::Get(const std::string& asset) const {
    auto it = entries_.find(asset);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void AggregateCache::Put(const std::string& asset, const AggregatePrice& aggregate) {
    entries_[asset] = aggregate;
}

// ============================================================================
// PriceAggregator
// ============================================================================

Result<AggregatePrice> PriceAggregator::Aggregate(const std::string& asset,
                                                  const AssetBook& book,
                                                  Height now,
                                                  const AggregationParams& params) {
    uint64_t weightedSum = 0;
    uint64_t totalWeight = 0;
    uint64_t count = 0;
    bool overflow = false;

    book.ForEach([&](const Principal& /*source*/, const Quote& quote) {
        if (overflow || !quote.active ||
            !StalenessGuard::IsFresh(quote.height, now, params.stalenessThreshold)) {
            return;
        }
        uint64_t term = 0;
        // GCC/Clang checked arithmetic, as serialize.h relies on __builtin_bswap
        if (__builtin_mul_overflow(quote.price, static_cast<uint64_t>(quote.weight), &term) ||
            __builtin_add_overflow(weightedSum, term, &weightedSum)) {
            overflow = true;
            return;
        }
        totalWeight += quote.weight;
        ++count;
    });

    if (overflow) {
        return Fail(OracleError::ArithmeticOverflow,
                    "weighted sum for " + asset + " exceeds 64 bits");
    }

    if (count == 0 || count < params.minSources) {
        return Fail(OracleError::InsufficientSources,
                    asset + " has " + std::to_string(count) + " fresh quotes, need " +
                    std::to_string(params.minSources));
    }

    AggregatePrice result;
    result.price = weightedSum / totalWeight;
    result.lastUpdateHeight = now;
    result.sourceCount = static_cast<uint32_t>(count);
    return result;
}

} // namespace oracle
} // namespace pricefeed
