// PRICEFEED - Administrative Controls
// Copyright (c) 2024 PRICEFEED Developers
// MIT License

#include "pricefeed/oracle/admin.h"

namespace pricefeed {
namespace oracle {

Result<void> AdminController::RequireOwner(const Principal& caller,
                                           const char* operation) const {
    if (!owner_.IsOwner(caller)) {
        return Fail(OracleError::NotAuthorized,
                    std::string(operation) + ": caller " + caller.ToHex() +
                    " is not the owner");
    }
    return Result<void>::Ok();
}

Result<AggregationParams> AdminController::PrepareMinSources(const Principal& caller,
                                                             uint64_t n) const {
    auto owner = RequireOwner(caller, "setMinSources");
    if (!owner) {
        return owner.failure();
    }
    if (n == 0) {
        return Fail(OracleError::InvalidPrice, "minimum sources must be at least 1");
    }
    AggregationParams next = params_;
    next.minSources = n;
    return next;
}

Result<AggregationParams> AdminController::PrepareStalenessThreshold(const Principal& caller,
                                                                     Height n) const {
    auto owner = RequireOwner(caller, "setStalenessThreshold");
    if (!owner) {
        return owner.failure();
    }
    if (n == 0) {
        return Fail(OracleError::InvalidPrice, "staleness threshold must be at least 1");
    }
    AggregationParams next = params_;
    next.stalenessThreshold = n;
    return next;
}

Result<AssetBook> AdminController::PreparePause(const Principal& caller,
                                                const std::string& asset,
                                                const AssetBook* book,
                                                const Principal& source) const {
    auto owner = RequireOwner(caller, "pauseSource");
    if (!owner) {
        return owner.failure();
    }
    if (!IsValidAsset(asset)) {
        return Fail(OracleError::InvalidAsset, "invalid asset identifier '" + asset + "'");
    }
    if (!book || !book->Find(source)) {
        return Fail(OracleError::SourceNotFound,
                    "no quote for " + asset + " from " + source.ToHex());
    }
    AssetBook next = *book;
    next.Deactivate(source);
    return next;
}

} // namespace oracle
} // namespace pricefeed
