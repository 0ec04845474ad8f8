// PRICEFEED - Administrative Controls
// Copyright (c) 2024 PRICEFEED Developers
// MIT License
//
// Owner-gated changes to aggregation parameters and quote pause state.

#ifndef PRICEFEED_ORACLE_ADMIN_H
#define PRICEFEED_ORACLE_ADMIN_H

#include "pricefeed/core/types.h"
#include "pricefeed/oracle/aggregator.h"
#include "pricefeed/oracle/authorization.h"
#include "pricefeed/oracle/errors.h"
#include "pricefeed/oracle/quote_store.h"

#include <string>

namespace pricefeed {
namespace oracle {

class AdminController {
public:
    AdminController(const OwnerCapability& owner, const AggregationParams& params)
        : owner_(owner), params_(params) {}

    /// NotAuthorized unless caller is the owner
    Result<void> RequireOwner(const Principal& caller, const char* operation) const;

    /// Parameters after setMinSources(n); InvalidPrice when n == 0
    Result<AggregationParams> PrepareMinSources(const Principal& caller, uint64_t n) const;

    /// Parameters after setStalenessThreshold(n); InvalidPrice when n == 0
    Result<AggregationParams> PrepareStalenessThreshold(const Principal& caller,
                                                        Height n) const;

    /**
     * Copy of the asset's book with source's quote paused.
     * SourceNotFound when the asset has no quote from source.
     */
    Result<AssetBook> PreparePause(const Principal& caller,
                                   const std::string& asset,
                                   const AssetBook* book,
                                   const Principal& source) const;

    const AggregationParams& Params() const { return params_; }
    void Apply(const AggregationParams& params) { params_ = params; }

private:
    const OwnerCapability& owner_;
    AggregationParams params_;
};

} // namespace oracle
} // namespace pricefeed

#endif // PRICEFEED_ORACLE_ADMIN_H
