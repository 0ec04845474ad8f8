// PRICEFEED - Staleness Guard
// Copyright (c) 2024 PRICEFEED Developers
// MIT License

#include "pricefeed/oracle/staleness.h"

namespace pricefeed {
namespace oracle {

Result<Price> StalenessGuard::Check(const std::string& asset,
                                    const std::optional<AggregatePrice>& aggregate,
                                    Height now, Height threshold) {
    if (!aggregate) {
        return Fail(OracleError::SourceNotFound, "no aggregate price for " + asset);
    }
    if (!IsFresh(aggregate->lastUpdateHeight, now, threshold)) {
        return Fail(OracleError::StalePrice,
                    asset + " last updated at " + std::to_string(aggregate->lastUpdateHeight) +
                    ", now " + std::to_string(now) +
                    ", threshold " + std::to_string(threshold));
    }
    return aggregate->price;
}

} // namespace oracle
} // namespace pricefeed
