// PRICEFEED - Aggregation Tests
// Copyright (c) 2024 PRICEFEED Developers
// MIT License

#include <gtest/gtest.h>

#include "pricefeed/oracle/aggregator.h"
#include "pricefeed/oracle/clock.h"
#include "pricefeed/oracle/conversion.h"
#include "pricefeed/oracle/errors.h"
#include "pricefeed/oracle/quote_store.h"
#include "pricefeed/oracle/staleness.h"

#include <array>
#include <limits>

namespace pricefeed {
namespace oracle {
namespace {

// ============================================================================
// Test Fixtures
// ============================================================================

class AggregatorTest : public ::testing::Test {
protected:
    AggregationParams params_;

    Principal CreateTestSource(Byte value) {
        std::array<Byte, 20> data{};
        data.fill(value);
        return Principal(data);
    }

    static Quote MakeQuote(Price price, Weight weight, Height height, bool active = true) {
        Quote quote;
        quote.price = price;
        quote.weight = weight;
        quote.height = height;
        quote.active = active;
        return quote;
    }
};

// ============================================================================
// Asset Identifiers
// ============================================================================

TEST(AssetTest, ValidIdentifiers) {
    EXPECT_TRUE(IsValidAsset("STX"));
    EXPECT_TRUE(IsValidAsset("BTC/USD"));
    EXPECT_TRUE(IsValidAsset(std::string(MAX_ASSET_LENGTH, 'A')));
}

TEST(AssetTest, InvalidIdentifiers) {
    EXPECT_FALSE(IsValidAsset(""));
    EXPECT_FALSE(IsValidAsset(std::string(MAX_ASSET_LENGTH + 1, 'A')));
    EXPECT_FALSE(IsValidAsset("ST X"));
    EXPECT_FALSE(IsValidAsset("STX\n"));
    EXPECT_FALSE(IsValidAsset("\x7f"));
}

// ============================================================================
// Asset Book
// ============================================================================

TEST_F(AggregatorTest, BookKeepsRegistrationOrder) {
    AssetBook book;
    Principal s1 = CreateTestSource(0x22);
    Principal s2 = CreateTestSource(0x11);

    EXPECT_TRUE(book.Upsert(s1, MakeQuote(10, 1, 1)));
    EXPECT_TRUE(book.Upsert(s2, MakeQuote(20, 1, 2)));
    EXPECT_FALSE(book.Upsert(s1, MakeQuote(30, 1, 3)));

    ASSERT_EQ(book.Size(), 2u);
    EXPECT_EQ(book.Sources()[0], s1);
    EXPECT_EQ(book.Sources()[1], s2);
    EXPECT_EQ(book.Find(s1)->price, 30u);
}

TEST_F(AggregatorTest, BookDeactivate) {
    AssetBook book;
    Principal s1 = CreateTestSource(1);
    book.Upsert(s1, MakeQuote(10, 1, 1));

    EXPECT_TRUE(book.Deactivate(s1));
    EXPECT_FALSE(book.Find(s1)->active);
    EXPECT_FALSE(book.Deactivate(CreateTestSource(2)));
    EXPECT_EQ(book.Find(CreateTestSource(2)), nullptr);
}

TEST_F(AggregatorTest, QuoteStoreLookup) {
    QuoteStore store;
    Principal s1 = CreateTestSource(1);
    EXPECT_EQ(store.Book("STX"), nullptr);
    EXPECT_FALSE(store.Get("STX", s1).has_value());

    AssetBook book;
    book.Upsert(s1, MakeQuote(10, 5, 7));
    store.PutBook("STX", book);

    auto quote = store.Get("STX", s1);
    ASSERT_TRUE(quote.has_value());
    EXPECT_EQ(*quote, MakeQuote(10, 5, 7));
    EXPECT_EQ(store.Assets(), std::vector<std::string>{"STX"});
}

// ============================================================================
// Weighted Aggregation
// ============================================================================

TEST_F(AggregatorTest, SingleQuote) {
    AssetBook book;
    book.Upsert(CreateTestSource(1), MakeQuote(1850000, 50, 10));

    auto result = PriceAggregator::Aggregate("STX", book, 10, params_);
    ASSERT_TRUE(result.ok()) << result.ToString();
    EXPECT_EQ(result.value().price, 1850000u);
    EXPECT_EQ(result.value().lastUpdateHeight, 10u);
    EXPECT_EQ(result.value().sourceCount, 1u);
}

TEST_F(AggregatorTest, WeightedAverageTruncates) {
    AssetBook book;
    book.Upsert(CreateTestSource(1), MakeQuote(100, 1, 0));
    book.Upsert(CreateTestSource(2), MakeQuote(201, 2, 0));

    // (100 + 402) / 3 = 167.33
    auto result = PriceAggregator::Aggregate("STX", book, 0, params_);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().price, 167u);
    EXPECT_EQ(result.value().sourceCount, 2u);
}

TEST_F(AggregatorTest, SkipsInactiveAndStaleQuotes) {
    AssetBook book;
    book.Upsert(CreateTestSource(1), MakeQuote(100, 10, 200));
    book.Upsert(CreateTestSource(2), MakeQuote(999, 10, 200, false));
    book.Upsert(CreateTestSource(3), MakeQuote(555, 10, 79));   // 121 old at 200
    book.Upsert(CreateTestSource(4), MakeQuote(300, 10, 80));   // 120 old at 200

    auto result = PriceAggregator::Aggregate("STX", book, 200, params_);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().price, 200u);
    EXPECT_EQ(result.value().sourceCount, 2u);
}

TEST_F(AggregatorTest, InsufficientSources) {
    AssetBook book;
    book.Upsert(CreateTestSource(1), MakeQuote(100, 10, 0));
    params_.minSources = 2;

    auto result = PriceAggregator::Aggregate("USD", book, 0, params_);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error(), OracleError::InsufficientSources);
}

TEST_F(AggregatorTest, NoFreshQuotesIsInsufficient) {
    AssetBook book;
    book.Upsert(CreateTestSource(1), MakeQuote(100, 10, 0, false));

    auto result = PriceAggregator::Aggregate("STX", book, 0, params_);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error(), OracleError::InsufficientSources);
}

TEST_F(AggregatorTest, OverflowIsReported) {
    AssetBook book;
    book.Upsert(CreateTestSource(1), MakeQuote(std::numeric_limits<Price>::max() / 2, 100, 0));

    auto result = PriceAggregator::Aggregate("BIG", book, 0, params_);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error(), OracleError::ArithmeticOverflow);
}

TEST_F(AggregatorTest, SumOverflowIsReported) {
    AssetBook book;
    Price half = std::numeric_limits<Price>::max() / 2 + 1;
    book.Upsert(CreateTestSource(1), MakeQuote(half, 1, 0));
    book.Upsert(CreateTestSource(2), MakeQuote(half, 1, 0));

    auto result = PriceAggregator::Aggregate("BIG", book, 0, params_);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error(), OracleError::ArithmeticOverflow);
}

TEST_F(AggregatorTest, CacheOverwrites) {
    AggregateCache cache;
    EXPECT_FALSE(cache.Get("STX").has_value());

    cache.Put("STX", AggregatePrice{10, 1, 1});
    cache.Put("STX", AggregatePrice{20, 2, 2});
    ASSERT_TRUE(cache.Get("STX").has_value());
    EXPECT_EQ(cache.Get("STX")->price, 20u);
    EXPECT_EQ(cache.Entries().size(), 1u);
}

// ============================================================================
// Staleness
// ============================================================================

TEST(StalenessTest, BoundaryIsInclusive) {
    EXPECT_TRUE(StalenessGuard::IsFresh(0, 120, 120));
    EXPECT_FALSE(StalenessGuard::IsFresh(0, 121, 120));
    EXPECT_TRUE(StalenessGuard::IsFresh(50, 10, 120));
}

TEST(StalenessTest, CheckReportsKinds) {
    auto missing = StalenessGuard::Check("STX", std::nullopt, 0, 120);
    EXPECT_EQ(missing.error(), OracleError::SourceNotFound);

    AggregatePrice aggregate{1850000, 0, 1};
    auto fresh = StalenessGuard::Check("STX", aggregate, 120, 120);
    ASSERT_TRUE(fresh.ok());
    EXPECT_EQ(fresh.value(), 1850000u);

    auto stale = StalenessGuard::Check("STX", aggregate, 121, 120);
    ASSERT_FALSE(stale.ok());
    EXPECT_EQ(stale.error(), OracleError::StalePrice);
}

// ============================================================================
// Conversion
// ============================================================================

TEST(ConversionTest, Truncates) {
    auto result = ConvertAmount(10, 3, 4);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value(), 7u);
}

TEST(ConversionTest, BackAndForthNeverGains) {
    Price a = 1850000;
    Price b = 999983;
    for (uint64_t x : {1ULL, 7ULL, 1000ULL, 123456789ULL}) {
        auto there = ConvertAmount(x, a, b);
        ASSERT_TRUE(there.ok());
        auto back = ConvertAmount(there.value(), b, a);
        ASSERT_TRUE(back.ok());
        EXPECT_LE(back.value(), x);
    }

    auto same = ConvertAmount(42, b, b);
    ASSERT_TRUE(same.ok());
    EXPECT_EQ(same.value(), 42u);
}

TEST(ConversionTest, OverflowAndZeroTarget) {
    EXPECT_EQ(ConvertAmount(std::numeric_limits<uint64_t>::max(), 2, 1).error(),
              OracleError::ArithmeticOverflow);
    EXPECT_EQ(ConvertAmount(1, 1, 0).error(), OracleError::InvalidPrice);
}

// ============================================================================
// Errors and Clock
// ============================================================================

TEST(OracleErrorTest, CodesAndNames) {
    EXPECT_EQ(OracleErrorCode(OracleError::NotAuthorized), 100u);
    EXPECT_EQ(OracleErrorCode(OracleError::StorageError), 108u);
    EXPECT_STREQ(OracleErrorToString(OracleError::StalePrice), "StalePrice");
    EXPECT_EQ(Fail(OracleError::StalePrice, "old").ToString(), "u102 StalePrice: old");
    EXPECT_EQ(Fail(OracleError::InvalidAsset).ToString(), "u106 InvalidAsset");
}

TEST(OracleErrorTest, ValueOnFailureThrows) {
    Result<Price> result = Fail(OracleError::SourceNotFound, "none");
    EXPECT_FALSE(result);
    EXPECT_THROW(result.value(), std::logic_error);
    EXPECT_EQ(result.value_or(5), 5u);
}

TEST(ClockTest, ManualClockIsMonotonic) {
    ManualClock clock(10);
    EXPECT_FALSE(clock.SetHeight(9));
    EXPECT_EQ(clock.CurrentHeight(), 10u);
    EXPECT_TRUE(clock.SetHeight(10));
    clock.Advance(5);
    EXPECT_EQ(clock.CurrentHeight(), 15u);
    clock.Advance(std::numeric_limits<Height>::max());
    EXPECT_EQ(clock.CurrentHeight(), std::numeric_limits<Height>::max());
}

} // namespace
} // namespace oracle
} // namespace pricefeed
