// PRICEFEED - Quote Store
// Copyright (c) 2024 PRICEFEED Developers
// MIT License

#include "pricefeed/oracle/quote_store.h"

#include <sstream>

namespace pricefeed {
namespace oracle {

bool IsValidAsset(const std::string& asset) {
    if (asset.empty() || asset.size() > MAX_ASSET_LENGTH) {
        return false;
    }
    for (char c : asset) {
        // Printable ASCII excluding space
        if (c <= 0x20 || c >= 0x7f) {
            return false;
        }
    }
    return true;
}

std::string Quote::ToString() const {
    std::ostringstream ss;
    ss << "Quote(price=" << price
       << ", weight=" << weight
       << ", height=" << height
       << ", active=" << (active ? "true" : "false") << ")";
    return ss.str();
}

// ============================================================================
// AssetBook
// ============================================================================

const Quote* AssetBook::Find(const Principal& source) const {
    auto it = quotes_.find(source);
    return it == quotes_.end() ? nullptr : &it->second;
}

bool AssetBook::Upsert(const Principal& source, const Quote& quote) {
    auto [it, inserted] = quotes_.insert_or_assign(source, quote);
    (void)it;
    if (inserted) {
        order_.push_back(source);
    }
    return inserted;
}

bool AssetBook::Deactivate(const Principal& source) {
    auto it = quotes_.find(source);
    if (it == quotes_.end()) {
        return false;
    }
    it->second.active = false;
    return true;
}

// ============================================================================
// QuoteStore
// ============================================================================

std::optional<Quote> QuoteStore::Get(const std::string& asset,
                                     const Principal& source) const {
    const AssetBook* book = Book(asset);
    if (!book) {
        return std::nullopt;
    }
    const Quote* quote = book->Find(source);
    if (!quote) {
        return std::nullopt;
    }
    return *quote;
}

const AssetBook* QuoteStore::Book(const std::string& asset) const {
    auto it = books_.find(asset);
    return it == books_.end() ? nullptr : &it->second;
}

void QuoteStore::PutBook(const std::string& asset, AssetBook book) {
    books_[asset] = std::move(book);
}

std::vector<std::string> QuoteStore::Assets() const {
    std::vector<std::string> result;
    result.reserve(books_.size());
    for (const auto& entry : books_) {
        result.push_back(entry.first);
    }
    return result;
}

} // namespace oracle
} // namespace pricefeed
