// PRICEFEED - Staleness Guard
// Copyright (c) 2024 PRICEFEED Developers
// MIT License

#ifndef PRICEFEED_ORACLE_STALENESS_H
#define PRICEFEED_ORACLE_STALENESS_H

#include "pricefeed/core/types.h"
#include "pricefeed/oracle/aggregator.h"
#include "pricefeed/oracle/errors.h"

#include <optional>
#include <string>

namespace pricefeed {
namespace oracle {

/**
 * Rejects reads of aggregates older than the staleness threshold.
 * An aggregate is fresh while currentHeight - lastUpdateHeight <= threshold.
 */
class StalenessGuard {
public:
    /// True if a value recorded at `recorded` is still fresh at `now`
    static bool IsFresh(Height recorded, Height now, Height threshold) {
        // A height ahead of the clock counts as age zero
        return now <= recorded || now - recorded <= threshold;
    }

    /// SourceNotFound without an aggregate, StalePrice once it has aged out
    static Result<Price> Check(const std::string& asset,
                               const std::optional<AggregatePrice>& aggregate,
                               Height now, Height threshold);
};

} // namespace oracle
} // namespace pricefeed

#endif // PRICEFEED_ORACLE_STALENESS_H
