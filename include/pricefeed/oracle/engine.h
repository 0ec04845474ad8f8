// PRICEFEED - Price Feed Engine
// Copyright (c) 2024 PRICEFEED Developers
// MIT License
//
// Authorized reporters submit asset prices; the engine combines the fresh,
// active quotes of each asset into one weighted aggregate and refuses reads
// of aggregates that have gone stale.
//
// Every operation runs under a single mutex. When a StateStore is attached,
// the records an operation changes are committed as one batch before the
// in-memory tables are updated, so a storage failure leaves both unchanged.

#ifndef PRICEFEED_ORACLE_ENGINE_H
#define PRICEFEED_ORACLE_ENGINE_H

#include "pricefeed/core/types.h"
#include "pricefeed/db/database.h"
#include "pricefeed/oracle/admin.h"
#include "pricefeed/oracle/aggregator.h"
#include "pricefeed/oracle/authorization.h"
#include "pricefeed/oracle/clock.h"
#include "pricefeed/oracle/errors.h"
#include "pricefeed/oracle/quote_store.h"
#include "pricefeed/oracle/state_store.h"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace pricefeed {
namespace oracle {

// ============================================================================
// Events
// ============================================================================

/// Emitted for every accepted submission
struct QuoteSubmittedEvent {
    std::string asset;
    Principal source;
    Price price{0};
    Weight weight{0};
    Height height{0};
};

/// Emitted when a submission produced a new aggregate
struct AggregateUpdatedEvent {
    std::string asset;
    AggregatePrice aggregate;
};

// ============================================================================
// Price Feed Engine
// ============================================================================

class PriceFeedEngine {
public:
    using QuoteCallback = std::function<void(const QuoteSubmittedEvent&)>;
    using AggregateCallback = std::function<void(const AggregateUpdatedEvent&)>;

    /// Engine with a single fixed owner. Zero parameters are replaced by
    /// the defaults.
    PriceFeedEngine(const Principal& owner, const HeightClock& clock,
                    const AggregationParams& params = AggregationParams());

    PriceFeedEngine(std::unique_ptr<OwnerCapability> owner, const HeightClock& clock,
                    const AggregationParams& params = AggregationParams());

    ~PriceFeedEngine();

    PriceFeedEngine(const PriceFeedEngine&) = delete;
    PriceFeedEngine& operator=(const PriceFeedEngine&) = delete;

    // ========================================================================
    // Persistence
    // ========================================================================

    /**
     * Attach a state store. If it already holds state, the engine tables
     * and parameters are replaced by the stored ones; otherwise the current
     * engine state is written to it. Subsequent operations write through.
     *
     * Fails with InvalidArgument, leaving the engine detached, when the
     * clock is below the highest height recorded in the store.
     *
     * @param restored Set to true when state was loaded from the store
     */
    db::Status AttachStore(StateStore& store, bool* restored = nullptr);

    /// Record the clock height if it is above the highest height seen
    db::Status PersistHeight();

    /// Highest height any operation has run at, including earlier runs
    Height HighestHeight() const;

    // ========================================================================
    // Authorization
    // ========================================================================

    /// Owner-only; idempotent
    Result<void> AuthorizeSource(const Principal& caller, const Principal& source);

    /// Owner-only; idempotent. Existing quotes of the source are kept.
    Result<void> DeauthorizeSource(const Principal& caller, const Principal& source);

    bool IsAuthorized(const Principal& source) const;

    /// Authorized sources in authorization order
    std::vector<Principal> AuthorizedSources() const;

    // ========================================================================
    // Administration
    // ========================================================================

    Result<void> SetMinSources(const Principal& caller, uint64_t n);
    Result<void> SetStalenessThreshold(const Principal& caller, Height n);

    /// Deactivate a quote without deleting it; does not recompute the aggregate
    Result<void> PauseSource(const Principal& caller, const std::string& asset,
                             const Principal& source);

    uint64_t MinSources() const;
    Height StalenessThreshold() const;

    // ========================================================================
    // Submission
    // ========================================================================

    /**
     * Record the caller's quote for asset at the current height and
     * recompute the aggregate.
     *
     * Fails with InvalidAsset, NotAuthorized, or InvalidPrice (zero price,
     * weight outside 1-100), checked in that order. A failed recomputation
     * does not fail the submission; the previous aggregate is kept.
     *
     * @return The asset on success
     */
    Result<std::string> Submit(const Principal& caller, const std::string& asset,
                               Price price, uint64_t weight);

    // ========================================================================
    // Reads
    // ========================================================================

    /// Fresh aggregate price; SourceNotFound or StalePrice otherwise
    Result<Price> GetPrice(const std::string& asset) const;

    /// Raw aggregate regardless of age
    std::optional<AggregatePrice> GetPriceData(const std::string& asset) const;

    std::optional<Quote> GetSourceQuote(const std::string& asset,
                                        const Principal& source) const;

    /// Same check as GetPrice without failing; false for unknown assets
    bool IsPriceFresh(const std::string& asset) const;

    /// amount * price(from) / price(to); propagates GetPrice failures
    Result<uint64_t> Convert(const std::string& from, const std::string& to,
                             uint64_t amount) const;

    std::vector<std::string> Assets() const;

    // ========================================================================
    // Events
    // ========================================================================

    void OnQuoteSubmitted(QuoteCallback callback);
    void OnAggregateUpdated(AggregateCallback callback);

    const HeightClock& GetClock() const { return clock_; }

private:
    std::unique_ptr<OwnerCapability> owner_;
    const HeightClock& clock_;

    AuthorizationRegistry registry_;
    AdminController admin_;
    QuoteStore quotes_;
    AggregateCache aggregates_;
    StateStore* store_{nullptr};
    Height highestHeight_{0};

    mutable std::mutex mutex_;

    std::vector<QuoteCallback> quoteCallbacks_;
    std::vector<AggregateCallback> aggregateCallbacks_;
    mutable std::mutex callbackMutex_;

    /// Commit batch if a store is attached; StorageError on failure
    Result<void> CommitLocked(db::WriteBatch& batch, const char* operation);

    /// Stage the clock height when it raises the highest height; returns it
    Height StageHeightLocked(db::WriteBatch& batch) const;

    Result<Price> GetPriceLocked(const std::string& asset) const;

    PersistedState SnapshotLocked() const;
    void RestoreLocked(PersistedState state);

    void Emit(const QuoteSubmittedEvent& submitted,
              const std::optional<AggregateUpdatedEvent>& updated);
};

} // namespace oracle
} // namespace pricefeed

#endif // PRICEFEED_ORACLE_ENGINE_H
