// PRICEFEED - Quote Store
// Copyright (c) 2024 PRICEFEED Developers
// MIT License
//
// Latest quote per (asset, source). A new submission overwrites the previous
// quote in place; no history is kept.

#ifndef PRICEFEED_ORACLE_QUOTE_STORE_H
#define PRICEFEED_ORACLE_QUOTE_STORE_H

#include "pricefeed/core/types.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pricefeed {
namespace oracle {

// ============================================================================
// Constants
// ============================================================================

/// Maximum asset identifier length
constexpr size_t MAX_ASSET_LENGTH = 32;

constexpr Weight MIN_QUOTE_WEIGHT = 1;
constexpr Weight MAX_QUOTE_WEIGHT = 100;

/// 1-32 printable ASCII characters, no whitespace
bool IsValidAsset(const std::string& asset);

// ============================================================================
// Quote
// ============================================================================

struct Quote {
    Price price{0};
    Weight weight{0};
    Height height{0};
    bool active{false};

    bool operator==(const Quote& other) const {
        return price == other.price && weight == other.weight &&
               height == other.height && active == other.active;
    }

    std::string ToString() const;
};

// ============================================================================
// Asset Book
// ============================================================================

/**
 * Quotes for one asset, remembering the order in which each source first
 * submitted. Aggregation walks the quotes in that order.
 */
class AssetBook {
public:
    const Quote* Find(const Principal& source) const;

    /// Insert or overwrite; returns true if the source is new to this asset
    bool Upsert(const Principal& source, const Quote& quote);

    /// Mark a quote inactive; false if the source has no quote
    bool Deactivate(const Principal& source);

    /// Sources in registration order
    const std::vector<Principal>& Sources() const { return order_; }

    size_t Size() const { return order_.size(); }
    bool Empty() const { return order_.empty(); }

    /// Visit (source, quote) in registration order
    template<typename Func>
    void ForEach(Func&& func) const {
        for (const auto& source : order_) {
            func(source, quotes_.at(source));
        }
    }

private:
    std::vector<Principal> order_;
    std::map<Principal, Quote> quotes_;
};

// ============================================================================
// Quote Store
// ============================================================================

class QuoteStore {
public:
    std::optional<Quote> Get(const std::string& asset, const Principal& source) const;

    /// Book for asset, or nullptr if no quote was ever submitted for it
    const AssetBook* Book(const std::string& asset) const;

    /// Replace the whole book for an asset
    void PutBook(const std::string& asset, AssetBook book);

    std::vector<std::string> Assets() const;

    const std::map<std::string, AssetBook>& Books() const { return books_; }

    void Clear() { books_.clear(); }

private:
    std::map<std::string, AssetBook> books_;
};

} // namespace oracle
} // namespace pricefeed

#endif // PRICEFEED_ORACLE_QUOTE_STORE_H
