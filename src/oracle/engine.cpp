// PRICEFEED - Price Feed Engine
// Copyright (c) 2024 PRICEFEED Developers
// MIT License

#include "pricefeed/oracle/engine.h"
#include "pricefeed/oracle/conversion.h"
#include "pricefeed/oracle/staleness.h"
#include "pricefeed/util/logging.h"

#include <algorithm>
#include <string>

namespace pricefeed {
namespace oracle {

namespace {

Failure InvalidAssetFailure(const std::string& asset) {
    return Fail(OracleError::InvalidAsset, "invalid asset identifier '" + asset + "'");
}

/// Zero parameters cannot be stored; replace them with the defaults
AggregationParams SanitizeParams(AggregationParams params) {
    if (params.minSources == 0) {
        LOG_WARN(util::LogCategory::ADMIN) << "Zero minimum sources, using "
                                           << DEFAULT_MIN_SOURCES;
        params.minSources = DEFAULT_MIN_SOURCES;
    }
    if (params.stalenessThreshold == 0) {
        LOG_WARN(util::LogCategory::ADMIN) << "Zero staleness threshold, using "
                                           << DEFAULT_STALENESS_THRESHOLD;
        params.stalenessThreshold = DEFAULT_STALENESS_THRESHOLD;
    }
    return params;
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

PriceFeedEngine::PriceFeedEngine(const Principal& owner, const HeightClock& clock,
                                 const AggregationParams& params)
    : PriceFeedEngine(std::make_unique<SingleOwner>(owner), clock, params) {}

PriceFeedEngine::PriceFeedEngine(std::unique_ptr<OwnerCapability> owner,
                                 const HeightClock& clock,
                                 const AggregationParams& params)
    : owner_(std::move(owner))
    , clock_(clock)
    , registry_(*owner_)
    , admin_(*owner_, SanitizeParams(params)) {}

PriceFeedEngine::~PriceFeedEngine() = default;

// ============================================================================
// Persistence
// ============================================================================

PersistedState PriceFeedEngine::SnapshotLocked() const {
    PersistedState state;
    state.params = admin_.Params();
    state.sources = registry_.Records();
    state.books = quotes_.Books();
    state.aggregates = aggregates_.Entries();
    state.height = std::max(highestHeight_, clock_.CurrentHeight());
    return state;
}

void PriceFeedEngine::RestoreLocked(PersistedState state) {
    admin_.Apply(state.params);
    highestHeight_ = state.height;

    registry_.Clear();
    for (const auto& [source, record] : state.sources) {
        registry_.Apply(source, record);
    }

    quotes_.Clear();
    for (auto& [asset, book] : state.books) {
        quotes_.PutBook(asset, std::move(book));
    }

    aggregates_.Clear();
    for (const auto& [asset, aggregate] : state.aggregates) {
        aggregates_.Put(asset, aggregate);
    }
}

db::Status PriceFeedEngine::AttachStore(StateStore& store, bool* restored) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (restored) {
        *restored = false;
    }

    const Height now = clock_.CurrentHeight();

    if (store.HasState()) {
        PersistedState state;
        db::Status s = store.Load(state);
        if (!s.ok()) {
            LOG_ERROR(util::LogCategory::DB) << "Cannot restore engine state: " << s.ToString();
            return s;
        }
        if (now < state.height) {
            LOG_ERROR(util::LogCategory::DB) << "Clock at " << now
                                             << " is behind stored height " << state.height;
            return db::Status::InvalidArgument("height " + std::to_string(now) +
                                               " is below stored height " +
                                               std::to_string(state.height));
        }
        if (now > state.height) {
            db::WriteBatch batch;
            StateStore::StageHeight(batch, now);
            s = store.Commit(batch);
            if (!s.ok()) {
                return s;
            }
            state.height = now;
        }
        RestoreLocked(std::move(state));
        if (restored) {
            *restored = true;
        }
    } else {
        PersistedState state = SnapshotLocked();
        db::WriteBatch batch;
        StateStore::StageAll(batch, state);
        db::Status s = store.Commit(batch);
        if (!s.ok()) {
            return s;
        }
        highestHeight_ = state.height;
        LOG_INFO(util::LogCategory::DB) << "Initialized empty engine state in "
                                        << store.GetDatabase().GetName();
    }

    store_ = &store;
    return db::Status::Ok();
}

db::Status PriceFeedEngine::PersistHeight() {
    std::lock_guard<std::mutex> lock(mutex_);

    // CommitLocked stages the height
    db::WriteBatch batch;
    auto committed = CommitLocked(batch, "persistHeight");
    if (!committed) {
        return db::Status::IOError(committed.message());
    }
    return db::Status::Ok();
}

Height PriceFeedEngine::HighestHeight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::max(highestHeight_, clock_.CurrentHeight());
}

Height PriceFeedEngine::StageHeightLocked(db::WriteBatch& batch) const {
    const Height now = clock_.CurrentHeight();
    if (now > highestHeight_) {
        StateStore::StageHeight(batch, now);
    }
    return now;
}

Result<void> PriceFeedEngine::CommitLocked(db::WriteBatch& batch, const char* operation) {
    const Height now = StageHeightLocked(batch);
    if (store_) {
        db::Status s = store_->Commit(batch);
        if (!s.ok()) {
            return Fail(OracleError::StorageError,
                        std::string(operation) + ": " + s.ToString());
        }
    }
    highestHeight_ = std::max(highestHeight_, now);
    return Result<void>::Ok();
}

// ============================================================================
// Authorization
// ============================================================================

Result<void> PriceFeedEngine::AuthorizeSource(const Principal& caller,
                                              const Principal& source) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto prepared = registry_.PrepareAuthorize(caller, source);
    if (!prepared) {
        LOG_WARN(util::LogCategory::ADMIN) << prepared.message();
        return prepared.failure();
    }
    if (!prepared.value()) {
        LOG_DEBUG(util::LogCategory::ADMIN) << "Source " << source.ToHex()
                                            << " already authorized";
        return Result<void>::Ok();
    }

    db::WriteBatch batch;
    StateStore::StageSource(batch, source, *prepared.value());
    auto committed = CommitLocked(batch, "authorize");
    if (!committed) {
        return committed;
    }

    registry_.Apply(source, *prepared.value());
    LOG_INFO(util::LogCategory::ADMIN) << "Authorized source " << source.ToHex();
    return Result<void>::Ok();
}

Result<void> PriceFeedEngine::DeauthorizeSource(const Principal& caller,
                                                const Principal& source) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto prepared = registry_.PrepareDeauthorize(caller, source);
    if (!prepared) {
        LOG_WARN(util::LogCategory::ADMIN) << prepared.message();
        return prepared.failure();
    }
    if (!prepared.value()) {
        LOG_DEBUG(util::LogCategory::ADMIN) << "Source " << source.ToHex()
                                            << " not authorized";
        return Result<void>::Ok();
    }

    db::WriteBatch batch;
    StateStore::StageSource(batch, source, *prepared.value());
    auto committed = CommitLocked(batch, "deauthorize");
    if (!committed) {
        return committed;
    }

    registry_.Apply(source, *prepared.value());
    LOG_INFO(util::LogCategory::ADMIN) << "Deauthorized source " << source.ToHex();
    return Result<void>::Ok();
}

bool PriceFeedEngine::IsAuthorized(const Principal& source) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registry_.IsAuthorized(source);
}

std::vector<Principal> PriceFeedEngine::AuthorizedSources() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registry_.AuthorizedSources();
}

// ============================================================================
// Administration
// ============================================================================

Result<void> PriceFeedEngine::SetMinSources(const Principal& caller, uint64_t n) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto prepared = admin_.PrepareMinSources(caller, n);
    if (!prepared) {
        LOG_WARN(util::LogCategory::ADMIN) << "setMinSources rejected: " << prepared.ToString();
        return prepared.failure();
    }

    db::WriteBatch batch;
    StateStore::StageParams(batch, prepared.value());
    auto committed = CommitLocked(batch, "setMinSources");
    if (!committed) {
        return committed;
    }

    admin_.Apply(prepared.value());
    LOG_INFO(util::LogCategory::ADMIN) << "Minimum sources set to " << n;
    return Result<void>::Ok();
}

Result<void> PriceFeedEngine::SetStalenessThreshold(const Principal& caller, Height n) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto prepared = admin_.PrepareStalenessThreshold(caller, n);
    if (!prepared) {
        LOG_WARN(util::LogCategory::ADMIN) << "setStalenessThreshold rejected: "
                                           << prepared.ToString();
        return prepared.failure();
    }

    db::WriteBatch batch;
    StateStore::StageParams(batch, prepared.value());
    auto committed = CommitLocked(batch, "setStalenessThreshold");
    if (!committed) {
        return committed;
    }

    admin_.Apply(prepared.value());
    LOG_INFO(util::LogCategory::ADMIN) << "Staleness threshold set to " << n;
    return Result<void>::Ok();
}

Result<void> PriceFeedEngine::PauseSource(const Principal& caller, const std::string& asset,
                                          const Principal& source) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto prepared = admin_.PreparePause(caller, asset, quotes_.Book(asset), source);
    if (!prepared) {
        LOG_WARN(util::LogCategory::ADMIN) << "pauseSource rejected: " << prepared.ToString();
        return prepared.failure();
    }

    const AssetBook& next = prepared.value();
    db::WriteBatch batch;
    StateStore::StageQuote(batch, asset, source, *next.Find(source));
    auto committed = CommitLocked(batch, "pauseSource");
    if (!committed) {
        return committed;
    }

    quotes_.PutBook(asset, next);
    LOG_INFO(util::LogCategory::ADMIN) << "Paused " << source.ToHex() << " for " << asset;
    return Result<void>::Ok();
}

uint64_t PriceFeedEngine::MinSources() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return admin_.Params().minSources;
}

Height PriceFeedEngine::StalenessThreshold() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return admin_.Params().stalenessThreshold;
}

// ============================================================================
// Submission
// ============================================================================

Result<std::string> PriceFeedEngine::Submit(const Principal& caller, const std::string& asset,
                                            Price price, uint64_t weight) {
    QuoteSubmittedEvent submitted;
    std::optional<AggregateUpdatedEvent> updated;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (!IsValidAsset(asset)) {
            LOG_DEBUG(util::LogCategory::ORACLE) << "Rejected submission: invalid asset";
            return InvalidAssetFailure(asset);
        }
        if (!registry_.IsAuthorized(caller)) {
            LOG_WARN(util::LogCategory::ORACLE) << "Rejected " << asset << " quote from "
                                                << "unauthorized " << caller.ToHex();
            return Fail(OracleError::NotAuthorized,
                        "source " + caller.ToHex() + " is not authorized");
        }
        if (price == 0) {
            LOG_DEBUG(util::LogCategory::ORACLE) << "Rejected " << asset << " quote: zero price";
            return Fail(OracleError::InvalidPrice, "price must be positive");
        }
        if (weight < MIN_QUOTE_WEIGHT || weight > MAX_QUOTE_WEIGHT) {
            LOG_DEBUG(util::LogCategory::ORACLE) << "Rejected " << asset << " quote: weight "
                                                 << weight;
            return Fail(OracleError::InvalidPrice,
                        "weight " + std::to_string(weight) + " outside [1, 100]");
        }

        const Height now = clock_.CurrentHeight();

        Quote quote;
        quote.price = price;
        quote.weight = static_cast<Weight>(weight);
        quote.height = now;
        quote.active = true;

        const AssetBook* current = quotes_.Book(asset);
        AssetBook next = current ? *current : AssetBook();
        bool newSource = next.Upsert(caller, quote);

        auto aggregate = PriceAggregator::Aggregate(asset, next, now, admin_.Params());

        db::WriteBatch batch;
        StateStore::StageQuote(batch, asset, caller, quote);
        if (newSource) {
            StateStore::StageSourceOrder(batch, asset, next.Sources());
        }
        if (aggregate) {
            StateStore::StageAggregate(batch, asset, aggregate.value());
        }
        auto committed = CommitLocked(batch, "submit");
        if (!committed) {
            return committed.failure();
        }

        quotes_.PutBook(asset, std::move(next));

        LOG_DEBUG(util::LogCategory::ORACLE) << "Quote " << asset << " from " << caller.ToHex()
                                             << ": " << quote.ToString();

        if (aggregate) {
            aggregates_.Put(asset, aggregate.value());
            updated = AggregateUpdatedEvent{asset, aggregate.value()};
            LOG_DEBUG(util::LogCategory::ORACLE) << asset << " aggregate "
                                                 << aggregate.value().ToString();
        } else {
            LOG_WARN(util::LogCategory::ORACLE) << "Aggregate for " << asset << " unchanged: "
                                                << aggregate.ToString();
        }

        submitted.asset = asset;
        submitted.source = caller;
        submitted.price = price;
        submitted.weight = quote.weight;
        submitted.height = now;
    }

    Emit(submitted, updated);
    return asset;
}

// ============================================================================
// Reads
// ============================================================================

Result<Price> PriceFeedEngine::GetPriceLocked(const std::string& asset) const {
    if (!IsValidAsset(asset)) {
        return InvalidAssetFailure(asset);
    }
    return StalenessGuard::Check(asset, aggregates_.Get(asset), clock_.CurrentHeight(),
                                 admin_.Params().stalenessThreshold);
}

Result<Price> PriceFeedEngine::GetPrice(const std::string& asset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return GetPriceLocked(asset);
}

std::optional<AggregatePrice> PriceFeedEngine::GetPriceData(const std::string& asset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return aggregates_.Get(asset);
}

std::optional<Quote> PriceFeedEngine::GetSourceQuote(const std::string& asset,
                                                     const Principal& source) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return quotes_.Get(asset, source);
}

bool PriceFeedEngine::IsPriceFresh(const std::string& asset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return GetPriceLocked(asset).ok();
}

Result<uint64_t> PriceFeedEngine::Convert(const std::string& from, const std::string& to,
                                          uint64_t amount) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto priceFrom = GetPriceLocked(from);
    if (!priceFrom) {
        return priceFrom.failure();
    }
    auto priceTo = GetPriceLocked(to);
    if (!priceTo) {
        return priceTo.failure();
    }
    return ConvertAmount(amount, priceFrom.value(), priceTo.value());
}

std::vector<std::string> PriceFeedEngine::Assets() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return quotes_.Assets();
}

// ============================================================================
// Events
// ============================================================================

void PriceFeedEngine::OnQuoteSubmitted(QuoteCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    quoteCallbacks_.push_back(std::move(callback));
}

void PriceFeedEngine::OnAggregateUpdated(AggregateCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    aggregateCallbacks_.push_back(std::move(callback));
}

void PriceFeedEngine::Emit(const QuoteSubmittedEvent& submitted,
                           const std::optional<AggregateUpdatedEvent>& updated) {
    std::vector<QuoteCallback> quoteCallbacks;
    std::vector<AggregateCallback> aggregateCallbacks;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        quoteCallbacks = quoteCallbacks_;
        aggregateCallbacks = aggregateCallbacks_;
    }

    for (const auto& callback : quoteCallbacks) {
        callback(submitted);
    }
    if (updated) {
        for (const auto& callback : aggregateCallbacks) {
            callback(*updated);
        }
    }
}

} // namespace oracle
} // namespace pricefeed
