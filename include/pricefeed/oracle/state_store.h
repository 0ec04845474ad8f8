// PRICEFEED - Engine State Persistence
// Copyright (c) 2024 PRICEFEED Developers
// MIT License
//
// Maps the engine tables onto a key-value database:
//
//   'A' asset            -> price u64, lastUpdateHeight u64, sourceCount u32
//   'Q' asset, source    -> price u64, weight u32, height u64, active bool
//   'S' source           -> authorized bool, sequence u64
//   'O' asset            -> sources in registration order
//   'M' name             -> u64 parameter ("minsources", "staleness", "height")
//
// "height" is the highest height any run has operated at; a clock below it
// would make stale prices look fresh again.
//
// Writes are staged into a db::WriteBatch so an operation commits atomically.

#ifndef PRICEFEED_ORACLE_STATE_STORE_H
#define PRICEFEED_ORACLE_STATE_STORE_H

#include "pricefeed/core/types.h"
#include "pricefeed/db/database.h"
#include "pricefeed/oracle/aggregator.h"
#include "pricefeed/oracle/authorization.h"
#include "pricefeed/oracle/quote_store.h"

#include <map>
#include <string>
#include <vector>

namespace pricefeed {
namespace oracle {

/// Everything the engine persists
struct PersistedState {
    AggregationParams params;
    std::map<Principal, SourceRecord> sources;
    std::map<std::string, AssetBook> books;
    std::map<std::string, AggregatePrice> aggregates;
    Height height{0};
};

class StateStore {
public:
    /// Parameter names under the 'M' prefix
    static constexpr const char* PARAM_MIN_SOURCES = "minsources";
    static constexpr const char* PARAM_STALENESS = "staleness";
    static constexpr const char* PARAM_HEIGHT = "height";

    explicit StateStore(db::Database& db, bool syncWrites = false)
        : db_(db), syncWrites_(syncWrites) {}

    // ========================================================================
    // Staging
    // ========================================================================

    static void StageQuote(db::WriteBatch& batch, const std::string& asset,
                           const Principal& source, const Quote& quote);

    static void StageSourceOrder(db::WriteBatch& batch, const std::string& asset,
                                 const std::vector<Principal>& sources);

    static void StageAggregate(db::WriteBatch& batch, const std::string& asset,
                               const AggregatePrice& aggregate);

    static void StageSource(db::WriteBatch& batch, const Principal& source,
                            const SourceRecord& record);

    static void StageParams(db::WriteBatch& batch, const AggregationParams& params);

    static void StageHeight(db::WriteBatch& batch, Height height);

    /// Stage every record of state
    static void StageAll(db::WriteBatch& batch, const PersistedState& state);

    // ========================================================================
    // Database Access
    // ========================================================================

    /// Apply a staged batch atomically
    db::Status Commit(db::WriteBatch& batch);

    /// True once parameters have been written
    bool HasState();

    /// Highest recorded height; NotFound if none was written
    db::Status StoredHeight(Height& out);

    /**
     * Read all records back.
     * Corruption on undecodable records, on quotes missing from the
     * registration order (or the reverse), and on values that break the
     * table invariants.
     */
    db::Status Load(PersistedState& out);

    db::Database& GetDatabase() { return db_; }

private:
    db::Database& db_;
    bool syncWrites_;
};

} // namespace oracle
} // namespace pricefeed

#endif // PRICEFEED_ORACLE_STATE_STORE_H
