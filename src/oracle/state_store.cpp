// PRICEFEED - Engine State Persistence
// Copyright (c) 2024 PRICEFEED Developers
// MIT License

#include "pricefeed/oracle/state_store.h"
#include "pricefeed/core/serialize.h"
#include "pricefeed/util/logging.h"

#include <set>
#include <utility>

namespace pricefeed {
namespace oracle {

namespace {

// ============================================================================
// Record Encoding
// ============================================================================

std::string EncodeQuote(const Quote& quote) {
    DataStream ss;
    ss << quote.price << quote.weight << quote.height << quote.active;
    return ss.Str();
}

std::string EncodeAggregate(const AggregatePrice& aggregate) {
    DataStream ss;
    ss << aggregate.price << aggregate.lastUpdateHeight << aggregate.sourceCount;
    return ss.Str();
}

std::string EncodeSource(const SourceRecord& record) {
    DataStream ss;
    ss << record.authorized << record.sequence;
    return ss.Str();
}

DataStream StreamOf(const db::Slice& slice) {
    return DataStream(reinterpret_cast<const uint8_t*>(slice.data()), slice.size());
}

/// Throws std::ios_base::failure when bytes remain
void ExpectEnd(const DataStream& ss, const char* what) {
    if (!ss.empty()) {
        throw std::ios_base::failure(std::string("trailing bytes in ") + what);
    }
}

using QuoteKey = std::pair<std::string, Principal>;

} // namespace

// ============================================================================
// Staging
// ============================================================================

void StateStore::StageQuote(db::WriteBatch& batch, const std::string& asset,
                            const Principal& source, const Quote& quote) {
    batch.Put(db::MakeKey(db::prefix::QUOTE, asset, source), EncodeQuote(quote));
}

void StateStore::StageSourceOrder(db::WriteBatch& batch, const std::string& asset,
                                  const std::vector<Principal>& sources) {
    batch.Put(db::MakeKey(db::prefix::SOURCE_ORDER, asset),
              db::SerializeToString(sources));
}

void StateStore::StageAggregate(db::WriteBatch& batch, const std::string& asset,
                                const AggregatePrice& aggregate) {
    batch.Put(db::MakeKey(db::prefix::AGGREGATE, asset), EncodeAggregate(aggregate));
}

void StateStore::StageSource(db::WriteBatch& batch, const Principal& source,
                             const SourceRecord& record) {
    batch.Put(db::MakeKey(db::prefix::SOURCE, source), EncodeSource(record));
}

void StateStore::StageParams(db::WriteBatch& batch, const AggregationParams& params) {
    batch.Put(db::MakeKey(db::prefix::PARAM, std::string(PARAM_MIN_SOURCES)),
              db::SerializeToString(params.minSources));
    batch.Put(db::MakeKey(db::prefix::PARAM, std::string(PARAM_STALENESS)),
              db::SerializeToString(params.stalenessThreshold));
}

void StateStore::StageHeight(db::WriteBatch& batch, Height height) {
    batch.Put(db::MakeKey(db::prefix::PARAM, std::string(PARAM_HEIGHT)),
              db::SerializeToString(height));
}

void StateStore::StageAll(db::WriteBatch& batch, const PersistedState& state) {
    StageParams(batch, state.params);
    StageHeight(batch, state.height);
    for (const auto& [source, record] : state.sources) {
        StageSource(batch, source, record);
    }
    for (const auto& [asset, book] : state.books) {
        StageSourceOrder(batch, asset, book.Sources());
        book.ForEach([&batch, &asset](const Principal& source, const Quote& quote) {
            StageQuote(batch, asset, source, quote);
        });
    }
    for (const auto& [asset, aggregate] : state.aggregates) {
        StageAggregate(batch, asset, aggregate);
    }
}

// ============================================================================
// Database Access
// ============================================================================

db::Status StateStore::Commit(db::WriteBatch& batch) {
    if (batch.Empty()) {
        return db::Status::Ok();
    }
    db::WriteOptions options;
    options.sync = syncWrites_;
    db::Status s = db_.Write(options, &batch);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "State write of " << batch.Count()
                                         << " records failed: " << s.ToString();
    }
    return s;
}

bool StateStore::HasState() {
    return db_.Exists(db::MakeKey(db::prefix::PARAM, std::string(PARAM_MIN_SOURCES)));
}

db::Status StateStore::StoredHeight(Height& out) {
    std::string value;
    db::Status s = db_.Get(db::MakeKey(db::prefix::PARAM, std::string(PARAM_HEIGHT)), &value);
    if (!s.ok()) {
        return s;
    }
    try {
        DataStream ss = StreamOf(db::Slice(value));
        Height height = 0;
        ss >> height;
        ExpectEnd(ss, "height");
        out = height;
    } catch (const std::ios_base::failure& e) {
        return db::Status::Corruption(std::string("undecodable height: ") + e.what());
    }
    return db::Status::Ok();
}

db::Status StateStore::Load(PersistedState& out) {
    util::ScopedLogTimer timer(util::LogCategory::DB, "load engine state");

    PersistedState state;
    std::map<QuoteKey, Quote> quotes;
    std::map<std::string, std::vector<Principal>> orders;
    bool haveMinSources = false;
    bool haveStaleness = false;

    auto it = db_.NewIterator();
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
        db::Slice key = it->key();
        if (key.empty()) {
            return db::Status::Corruption("empty key");
        }
        char prefix = key[0];
        DataStream keyStream = StreamOf(db::Slice(key.data() + 1, key.size() - 1));
        DataStream valueStream = StreamOf(it->value());

        try {
            switch (prefix) {
                case db::prefix::AGGREGATE: {
                    std::string asset;
                    AggregatePrice aggregate;
                    keyStream >> asset;
                    valueStream >> aggregate.price >> aggregate.lastUpdateHeight
                                >> aggregate.sourceCount;
                    ExpectEnd(keyStream, "aggregate key");
                    ExpectEnd(valueStream, "aggregate");
                    if (!IsValidAsset(asset) || aggregate.price == 0) {
                        return db::Status::Corruption("invalid aggregate record for " + asset);
                    }
                    state.aggregates[asset] = aggregate;
                    break;
                }
                case db::prefix::QUOTE: {
                    std::string asset;
                    Principal source;
                    Quote quote;
                    keyStream >> asset >> source;
                    valueStream >> quote.price >> quote.weight >> quote.height >> quote.active;
                    ExpectEnd(keyStream, "quote key");
                    ExpectEnd(valueStream, "quote");
                    if (!IsValidAsset(asset) || quote.price == 0 ||
                        quote.weight < MIN_QUOTE_WEIGHT || quote.weight > MAX_QUOTE_WEIGHT) {
                        return db::Status::Corruption("invalid quote record for " + asset);
                    }
                    quotes[QuoteKey(asset, source)] = quote;
                    break;
                }
                case db::prefix::SOURCE: {
                    Principal source;
                    SourceRecord record;
                    keyStream >> source;
                    valueStream >> record.authorized >> record.sequence;
                    ExpectEnd(keyStream, "source key");
                    ExpectEnd(valueStream, "source");
                    state.sources[source] = record;
                    break;
                }
                case db::prefix::SOURCE_ORDER: {
                    std::string asset;
                    std::vector<Principal> sources;
                    keyStream >> asset;
                    valueStream >> sources;
                    ExpectEnd(keyStream, "order key");
                    ExpectEnd(valueStream, "order");
                    if (std::set<Principal>(sources.begin(), sources.end()).size() !=
                        sources.size()) {
                        return db::Status::Corruption("duplicate source in order of " + asset);
                    }
                    orders[asset] = std::move(sources);
                    break;
                }
                case db::prefix::PARAM: {
                    std::string name;
                    uint64_t value = 0;
                    keyStream >> name;
                    valueStream >> value;
                    ExpectEnd(keyStream, "parameter key");
                    ExpectEnd(valueStream, "parameter");
                    if (name == PARAM_HEIGHT) {
                        state.height = value;
                        break;
                    }
                    if (value == 0) {
                        return db::Status::Corruption("zero parameter " + name);
                    }
                    if (name == PARAM_MIN_SOURCES) {
                        state.params.minSources = value;
                        haveMinSources = true;
                    } else if (name == PARAM_STALENESS) {
                        state.params.stalenessThreshold = value;
                        haveStaleness = true;
                    } else {
                        LOG_WARN(util::LogCategory::DB) << "Ignoring unknown parameter " << name;
                    }
                    break;
                }
                default:
                    return db::Status::Corruption("unknown key prefix '" +
                                                  std::string(1, prefix) + "'");
            }
        } catch (const std::ios_base::failure& e) {
            return db::Status::Corruption(std::string("undecodable record: ") + e.what());
        }
    }

    db::Status iterStatus = it->status();
    if (!iterStatus.ok()) {
        return iterStatus;
    }

    if (!haveMinSources || !haveStaleness) {
        return db::Status::NotFound("engine parameters not stored");
    }

    // Rebuild books in registration order
    for (auto& [asset, sources] : orders) {
        AssetBook book;
        for (const auto& source : sources) {
            auto q = quotes.find(QuoteKey(asset, source));
            if (q == quotes.end()) {
                return db::Status::Corruption("order of " + asset + " names " +
                                              source.ToHex() + " without a quote");
            }
            book.Upsert(source, q->second);
            quotes.erase(q);
        }
        state.books[asset] = std::move(book);
    }
    if (!quotes.empty()) {
        return db::Status::Corruption("quote for " + quotes.begin()->first.first +
                                      " missing from registration order");
    }

    LOG_INFO(util::LogCategory::DB) << "Loaded state from " << db_.GetName() << ": "
                                    << state.sources.size() << " sources, "
                                    << state.books.size() << " assets, "
                                    << state.aggregates.size() << " aggregates at height "
                                    << state.height;
    out = std::move(state);
    return db::Status::Ok();
}

} // namespace oracle
} // namespace pricefeed
