// PRICEFEED - Price Feed Engine Tests
// Copyright (c) 2024 PRICEFEED Developers
// MIT License

#include <gtest/gtest.h>

#include "pricefeed/oracle/engine.h"

#include <array>
#include <atomic>
#include <thread>
#include <vector>

namespace pricefeed {
namespace oracle {
namespace {

// ============================================================================
// Test Fixtures
// ============================================================================

class EngineTest : public ::testing::Test {
protected:
    Principal owner_ = CreateTestAddress(0xAA);
    Principal source1_ = CreateTestAddress(0x01);
    Principal source2_ = CreateTestAddress(0x02);
    Principal stranger_ = CreateTestAddress(0xBB);
    ManualClock clock_{0};
    PriceFeedEngine engine_{owner_, clock_};

    static Principal CreateTestAddress(Byte value) {
        std::array<Byte, 20> data{};
        data.fill(value);
        return Principal(data);
    }

    void SetUp() override {
        ASSERT_TRUE(engine_.AuthorizeSource(owner_, source1_).ok());
        ASSERT_TRUE(engine_.AuthorizeSource(owner_, source2_).ok());
    }
};

// ============================================================================
// Submission and Reads
// ============================================================================

TEST_F(EngineTest, SubmitThenGetPrice) {
    auto submitted = engine_.Submit(source1_, "STX", 1850000, 50);
    ASSERT_TRUE(submitted.ok()) << submitted.ToString();
    EXPECT_EQ(submitted.value(), "STX");

    auto price = engine_.GetPrice("STX");
    ASSERT_TRUE(price.ok());
    EXPECT_EQ(price.value(), 1850000u);
    EXPECT_TRUE(engine_.IsPriceFresh("STX"));

    auto data = engine_.GetPriceData("STX");
    ASSERT_TRUE(data.has_value());
    EXPECT_EQ(data->lastUpdateHeight, 0u);
    EXPECT_EQ(data->sourceCount, 1u);
}

TEST_F(EngineTest, PriceGoesStale) {
    ASSERT_TRUE(engine_.Submit(source1_, "STX", 1850000, 50).ok());

    clock_.Advance(120);
    EXPECT_TRUE(engine_.GetPrice("STX").ok());

    clock_.Advance(1);
    auto price = engine_.GetPrice("STX");
    ASSERT_FALSE(price.ok());
    EXPECT_EQ(price.error(), OracleError::StalePrice);
    EXPECT_FALSE(engine_.IsPriceFresh("STX"));

    // Raw data is still readable
    ASSERT_TRUE(engine_.GetPriceData("STX").has_value());
    EXPECT_EQ(engine_.GetPriceData("STX")->price, 1850000u);
}

TEST_F(EngineTest, WeightedAcrossSources) {
    ASSERT_TRUE(engine_.Submit(source1_, "BTC", 100, 1).ok());
    clock_.Advance(3);
    ASSERT_TRUE(engine_.Submit(source2_, "BTC", 201, 2).ok());

    auto data = engine_.GetPriceData("BTC");
    ASSERT_TRUE(data.has_value());
    EXPECT_EQ(data->price, 167u);
    EXPECT_EQ(data->lastUpdateHeight, 3u);
    EXPECT_EQ(data->sourceCount, 2u);
}

TEST_F(EngineTest, InsufficientSourcesLeavesNoAggregate) {
    ASSERT_TRUE(engine_.SetMinSources(owner_, 2).ok());

    // The quote is recorded even though no aggregate can be formed
    ASSERT_TRUE(engine_.Submit(source1_, "USD", 1000000, 100).ok());
    EXPECT_TRUE(engine_.GetSourceQuote("USD", source1_).has_value());

    auto price = engine_.GetPrice("USD");
    ASSERT_FALSE(price.ok());
    EXPECT_EQ(price.error(), OracleError::SourceNotFound);

    ASSERT_TRUE(engine_.Submit(source2_, "USD", 1000002, 100).ok());
    auto fresh = engine_.GetPrice("USD");
    ASSERT_TRUE(fresh.ok());
    EXPECT_EQ(fresh.value(), 1000001u);
}

TEST_F(EngineTest, ResubmitMovesHeightOnly) {
    ASSERT_TRUE(engine_.Submit(source1_, "STX", 500, 10).ok());
    clock_.Advance(7);
    ASSERT_TRUE(engine_.Submit(source1_, "STX", 500, 10).ok());

    auto quote = engine_.GetSourceQuote("STX", source1_);
    ASSERT_TRUE(quote.has_value());
    EXPECT_EQ(quote->height, 7u);

    auto data = engine_.GetPriceData("STX");
    ASSERT_TRUE(data.has_value());
    EXPECT_EQ(data->price, 500u);
    EXPECT_EQ(data->lastUpdateHeight, 7u);
    EXPECT_EQ(data->sourceCount, 1u);
}

// ============================================================================
// Rejected Submissions
// ============================================================================

TEST_F(EngineTest, RejectsInvalidInput) {
    EXPECT_EQ(engine_.Submit(source1_, "", 100, 10).error(), OracleError::InvalidAsset);
    EXPECT_EQ(engine_.Submit(source1_, "S T X", 100, 10).error(), OracleError::InvalidAsset);
    EXPECT_EQ(engine_.Submit(source1_, "STX", 0, 10).error(), OracleError::InvalidPrice);
    EXPECT_EQ(engine_.Submit(source1_, "STX", 100, 0).error(), OracleError::InvalidPrice);
    EXPECT_EQ(engine_.Submit(source1_, "STX", 100, 101).error(), OracleError::InvalidPrice);

    EXPECT_FALSE(engine_.GetSourceQuote("STX", source1_).has_value());
    EXPECT_TRUE(engine_.Assets().empty());
}

TEST_F(EngineTest, InvalidSubmissionKeepsExistingQuote) {
    clock_.Advance(5);
    ASSERT_TRUE(engine_.Submit(source1_, "STX", 1850000, 50).ok());
    auto quoteBefore = engine_.GetSourceQuote("STX", source1_);
    auto aggregateBefore = engine_.GetPriceData("STX");
    ASSERT_TRUE(quoteBefore.has_value());
    ASSERT_TRUE(aggregateBefore.has_value());

    clock_.Advance(3);
    EXPECT_EQ(engine_.Submit(source1_, "STX", 0, 50).error(), OracleError::InvalidPrice);
    EXPECT_EQ(engine_.Submit(source1_, "STX", 1900000, 0).error(), OracleError::InvalidPrice);
    EXPECT_EQ(engine_.Submit(source1_, "STX", 1900000, 101).error(), OracleError::InvalidPrice);

    auto quoteAfter = engine_.GetSourceQuote("STX", source1_);
    ASSERT_TRUE(quoteAfter.has_value());
    EXPECT_EQ(quoteAfter->price, 1850000u);
    EXPECT_EQ(quoteAfter->weight, 50u);
    EXPECT_EQ(quoteAfter->height, 5u);
    EXPECT_TRUE(quoteAfter->active);
    EXPECT_EQ(quoteAfter, quoteBefore);
    EXPECT_EQ(engine_.GetPriceData("STX"), aggregateBefore);
}

TEST_F(EngineTest, ValidationOrder) {
    // Asset before authorization, authorization before price
    EXPECT_EQ(engine_.Submit(stranger_, "", 0, 0).error(), OracleError::InvalidAsset);
    EXPECT_EQ(engine_.Submit(stranger_, "STX", 0, 0).error(), OracleError::NotAuthorized);
    EXPECT_EQ(engine_.Submit(source1_, "STX", 0, 0).error(), OracleError::InvalidPrice);
}

TEST_F(EngineTest, UnauthorizedLeavesAggregateUnchanged) {
    ASSERT_TRUE(engine_.Submit(source1_, "STX", 1850000, 50).ok());
    auto before = engine_.GetPriceData("STX");

    auto result = engine_.Submit(stranger_, "STX", 1, 100);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error(), OracleError::NotAuthorized);
    EXPECT_EQ(engine_.GetPriceData("STX"), before);
    EXPECT_FALSE(engine_.GetSourceQuote("STX", stranger_).has_value());
}

TEST_F(EngineTest, InvalidAssetReads) {
    EXPECT_EQ(engine_.GetPrice("").error(), OracleError::InvalidAsset);
    EXPECT_EQ(engine_.GetPrice("NONE").error(), OracleError::SourceNotFound);
    EXPECT_FALSE(engine_.IsPriceFresh(""));
    EXPECT_FALSE(engine_.IsPriceFresh("NONE"));
}

// ============================================================================
// Administration
// ============================================================================

TEST_F(EngineTest, AdminRequiresOwner) {
    EXPECT_EQ(engine_.AuthorizeSource(stranger_, stranger_).error(), OracleError::NotAuthorized);
    EXPECT_EQ(engine_.DeauthorizeSource(stranger_, source1_).error(),
              OracleError::NotAuthorized);
    EXPECT_EQ(engine_.SetMinSources(stranger_, 2).error(), OracleError::NotAuthorized);
    EXPECT_EQ(engine_.SetStalenessThreshold(stranger_, 2).error(), OracleError::NotAuthorized);
    EXPECT_EQ(engine_.PauseSource(stranger_, "STX", source1_).error(),
              OracleError::NotAuthorized);

    EXPECT_FALSE(engine_.IsAuthorized(stranger_));
    EXPECT_EQ(engine_.MinSources(), DEFAULT_MIN_SOURCES);
    EXPECT_EQ(engine_.StalenessThreshold(), DEFAULT_STALENESS_THRESHOLD);
}

TEST_F(EngineTest, AuthorizedSourcesInOrder) {
    std::vector<Principal> expected = {source1_, source2_};
    EXPECT_EQ(engine_.AuthorizedSources(), expected);

    ASSERT_TRUE(engine_.AuthorizeSource(owner_, source1_).ok());
    EXPECT_EQ(engine_.AuthorizedSources(), expected);
}

TEST_F(EngineTest, DeauthorizeKeepsQuotes) {
    ASSERT_TRUE(engine_.Submit(source1_, "STX", 100, 10).ok());
    ASSERT_TRUE(engine_.DeauthorizeSource(owner_, source1_).ok());

    EXPECT_FALSE(engine_.IsAuthorized(source1_));
    EXPECT_TRUE(engine_.GetSourceQuote("STX", source1_).has_value());
    EXPECT_TRUE(engine_.GetPrice("STX").ok());
    EXPECT_EQ(engine_.Submit(source1_, "STX", 100, 10).error(), OracleError::NotAuthorized);
}

TEST_F(EngineTest, StalenessThresholdAppliesToReads) {
    ASSERT_TRUE(engine_.Submit(source1_, "STX", 100, 10).ok());
    clock_.Advance(11);
    EXPECT_TRUE(engine_.IsPriceFresh("STX"));

    ASSERT_TRUE(engine_.SetStalenessThreshold(owner_, 10).ok());
    EXPECT_EQ(engine_.StalenessThreshold(), 10u);
    EXPECT_EQ(engine_.GetPrice("STX").error(), OracleError::StalePrice);
}

TEST_F(EngineTest, PauseKeepsAggregateUntilStale) {
    ASSERT_TRUE(engine_.Submit(source1_, "STX", 100, 10).ok());
    ASSERT_TRUE(engine_.PauseSource(owner_, "STX", source1_).ok());

    auto quote = engine_.GetSourceQuote("STX", source1_);
    ASSERT_TRUE(quote.has_value());
    EXPECT_FALSE(quote->active);

    // Pausing does not recompute; the old aggregate serves until stale
    auto price = engine_.GetPrice("STX");
    ASSERT_TRUE(price.ok());
    EXPECT_EQ(price.value(), 100u);

    clock_.Advance(121);
    EXPECT_EQ(engine_.GetPrice("STX").error(), OracleError::StalePrice);
}

TEST_F(EngineTest, PausedQuoteExcludedFromNextAggregate) {
    ASSERT_TRUE(engine_.Submit(source1_, "STX", 100, 10).ok());
    ASSERT_TRUE(engine_.Submit(source2_, "STX", 300, 10).ok());
    ASSERT_TRUE(engine_.PauseSource(owner_, "STX", source1_).ok());
    ASSERT_TRUE(engine_.PauseSource(owner_, "STX", source1_).ok());

    ASSERT_TRUE(engine_.Submit(source2_, "STX", 300, 10).ok());
    auto data = engine_.GetPriceData("STX");
    ASSERT_TRUE(data.has_value());
    EXPECT_EQ(data->price, 300u);
    EXPECT_EQ(data->sourceCount, 1u);

    // Resubmitting reactivates the quote
    ASSERT_TRUE(engine_.Submit(source1_, "STX", 100, 10).ok());
    EXPECT_TRUE(engine_.GetSourceQuote("STX", source1_)->active);
    EXPECT_EQ(engine_.GetPriceData("STX")->price, 200u);
}

TEST_F(EngineTest, PauseUnknownQuote) {
    EXPECT_EQ(engine_.PauseSource(owner_, "STX", source1_).error(),
              OracleError::SourceNotFound);
    EXPECT_EQ(engine_.PauseSource(owner_, "", source1_).error(), OracleError::InvalidAsset);
}

// ============================================================================
// Conversion
// ============================================================================

TEST_F(EngineTest, Convert) {
    ASSERT_TRUE(engine_.Submit(source1_, "STX", 1850000, 50).ok());
    ASSERT_TRUE(engine_.Submit(source1_, "USD", 1000000, 50).ok());

    auto usd = engine_.Convert("STX", "USD", 1000);
    ASSERT_TRUE(usd.ok());
    EXPECT_EQ(usd.value(), 1850u);

    auto back = engine_.Convert("USD", "STX", usd.value());
    ASSERT_TRUE(back.ok());
    EXPECT_LE(back.value(), 1000u);
    EXPECT_EQ(back.value(), 1000u);

    auto roundDown = engine_.Convert("USD", "STX", 1);
    ASSERT_TRUE(roundDown.ok());
    EXPECT_EQ(roundDown.value(), 0u);
}

TEST_F(EngineTest, ConvertPropagatesFailures) {
    ASSERT_TRUE(engine_.Submit(source1_, "STX", 1850000, 50).ok());

    EXPECT_EQ(engine_.Convert("STX", "USD", 1).error(), OracleError::SourceNotFound);
    EXPECT_EQ(engine_.Convert("USD", "STX", 1).error(), OracleError::SourceNotFound);
    EXPECT_EQ(engine_.Convert("", "STX", 1).error(), OracleError::InvalidAsset);

    clock_.Advance(500);
    EXPECT_EQ(engine_.Convert("STX", "STX", 1).error(), OracleError::StalePrice);
}

// ============================================================================
// Events
// ============================================================================

TEST_F(EngineTest, EmitsEvents) {
    std::vector<QuoteSubmittedEvent> quotes;
    std::vector<AggregateUpdatedEvent> aggregates;
    engine_.OnQuoteSubmitted([&](const QuoteSubmittedEvent& e) { quotes.push_back(e); });
    engine_.OnAggregateUpdated([&](const AggregateUpdatedEvent& e) { aggregates.push_back(e); });

    clock_.SetHeight(5);
    ASSERT_TRUE(engine_.Submit(source1_, "STX", 100, 10).ok());
    ASSERT_EQ(quotes.size(), 1u);
    EXPECT_EQ(quotes[0].asset, "STX");
    EXPECT_EQ(quotes[0].source, source1_);
    EXPECT_EQ(quotes[0].price, 100u);
    EXPECT_EQ(quotes[0].weight, 10u);
    EXPECT_EQ(quotes[0].height, 5u);
    ASSERT_EQ(aggregates.size(), 1u);
    EXPECT_EQ(aggregates[0].aggregate.price, 100u);

    // No aggregate event when aggregation fails
    ASSERT_TRUE(engine_.SetMinSources(owner_, 3).ok());
    ASSERT_TRUE(engine_.Submit(source2_, "STX", 200, 10).ok());
    EXPECT_EQ(quotes.size(), 2u);
    EXPECT_EQ(aggregates.size(), 1u);

    // Nothing for rejected submissions
    EXPECT_FALSE(engine_.Submit(stranger_, "STX", 200, 10).ok());
    EXPECT_EQ(quotes.size(), 2u);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_F(EngineTest, ConcurrentSubmissions) {
    std::atomic<int> accepted{0};
    engine_.OnQuoteSubmitted([&](const QuoteSubmittedEvent&) { ++accepted; });

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&, t]() {
            const Principal& source = (t % 2 == 0) ? source1_ : source2_;
            for (int i = 0; i < 100; ++i) {
                auto result = engine_.Submit(source, "STX", 1000, 10);
                EXPECT_TRUE(result.ok());
                engine_.GetPrice("STX");
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(accepted.load(), 400);
    auto data = engine_.GetPriceData("STX");
    ASSERT_TRUE(data.has_value());
    EXPECT_EQ(data->price, 1000u);
    EXPECT_EQ(data->sourceCount, 2u);
}

} // namespace
} // namespace oracle
} // namespace pricefeed
