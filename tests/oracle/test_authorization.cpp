// PRICEFEED - Authorization and Admin Tests
// Copyright (c) 2024 PRICEFEED Developers
// MIT License

#include <gtest/gtest.h>

#include "pricefeed/oracle/admin.h"
#include "pricefeed/oracle/authorization.h"

#include <array>

namespace pricefeed {
namespace oracle {
namespace {

// ============================================================================
// Test Fixtures
// ============================================================================

Principal CreateTestAddress(Byte value) {
    std::array<Byte, 20> data{};
    data.fill(value);
    return Principal(data);
}

class AuthorizationTest : public ::testing::Test {
protected:
    Principal owner_ = CreateTestAddress(0xAA);
    Principal stranger_ = CreateTestAddress(0xBB);
    SingleOwner capability_{owner_};
    AuthorizationRegistry registry_{capability_};

    void Authorize(const Principal& source) {
        auto prepared = registry_.PrepareAuthorize(owner_, source);
        ASSERT_TRUE(prepared.ok()) << prepared.ToString();
        if (prepared.value()) {
            registry_.Apply(source, *prepared.value());
        }
    }

    void Deauthorize(const Principal& source) {
        auto prepared = registry_.PrepareDeauthorize(owner_, source);
        ASSERT_TRUE(prepared.ok()) << prepared.ToString();
        if (prepared.value()) {
            registry_.Apply(source, *prepared.value());
        }
    }
};

// ============================================================================
// Authorization Registry
// ============================================================================

TEST_F(AuthorizationTest, UnknownSourceIsNotAuthorized) {
    EXPECT_FALSE(registry_.IsAuthorized(CreateTestAddress(1)));
    EXPECT_FALSE(registry_.Find(CreateTestAddress(1)).has_value());
    EXPECT_TRUE(registry_.AuthorizedSources().empty());
}

TEST_F(AuthorizationTest, OnlyOwnerMayAuthorize) {
    auto result = registry_.PrepareAuthorize(stranger_, CreateTestAddress(1));
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error(), OracleError::NotAuthorized);

    auto revoke = registry_.PrepareDeauthorize(stranger_, CreateTestAddress(1));
    ASSERT_FALSE(revoke.ok());
    EXPECT_EQ(revoke.error(), OracleError::NotAuthorized);
}

TEST_F(AuthorizationTest, AuthorizeIsIdempotent) {
    Principal source = CreateTestAddress(1);
    Authorize(source);
    EXPECT_TRUE(registry_.IsAuthorized(source));

    auto again = registry_.PrepareAuthorize(owner_, source);
    ASSERT_TRUE(again.ok());
    EXPECT_FALSE(again.value().has_value());
}

TEST_F(AuthorizationTest, DeauthorizeUnknownIsNoOp) {
    auto result = registry_.PrepareDeauthorize(owner_, CreateTestAddress(7));
    ASSERT_TRUE(result.ok());
    EXPECT_FALSE(result.value().has_value());
}

TEST_F(AuthorizationTest, SourcesListedInAuthorizationOrder) {
    Principal s1 = CreateTestAddress(0x30);
    Principal s2 = CreateTestAddress(0x10);
    Principal s3 = CreateTestAddress(0x20);
    Authorize(s1);
    Authorize(s2);
    Authorize(s3);

    std::vector<Principal> expected = {s1, s2, s3};
    EXPECT_EQ(registry_.AuthorizedSources(), expected);

    Deauthorize(s2);
    expected = {s1, s3};
    EXPECT_EQ(registry_.AuthorizedSources(), expected);
    ASSERT_TRUE(registry_.Find(s2).has_value());
    EXPECT_FALSE(registry_.Find(s2)->authorized);

    // Re-authorizing moves the source to the end
    Authorize(s2);
    expected = {s1, s3, s2};
    EXPECT_EQ(registry_.AuthorizedSources(), expected);
}

TEST_F(AuthorizationTest, ApplyAdvancesSequence) {
    SourceRecord restored;
    restored.authorized = true;
    restored.sequence = 41;
    registry_.Apply(CreateTestAddress(1), restored);

    auto next = registry_.PrepareAuthorize(owner_, CreateTestAddress(2));
    ASSERT_TRUE(next.ok());
    ASSERT_TRUE(next.value().has_value());
    EXPECT_EQ(next.value()->sequence, 42u);

    registry_.Clear();
    EXPECT_TRUE(registry_.Records().empty());
}

// ============================================================================
// Admin Controller
// ============================================================================

class AdminTest : public ::testing::Test {
protected:
    Principal owner_ = CreateTestAddress(0xAA);
    Principal stranger_ = CreateTestAddress(0xBB);
    SingleOwner capability_{owner_};
    AdminController admin_{capability_, AggregationParams{}};
};

TEST_F(AdminTest, MinSources) {
    auto result = admin_.PrepareMinSources(owner_, 3);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().minSources, 3u);
    EXPECT_EQ(result.value().stalenessThreshold, DEFAULT_STALENESS_THRESHOLD);

    // Not applied until Apply
    EXPECT_EQ(admin_.Params().minSources, DEFAULT_MIN_SOURCES);
    admin_.Apply(result.value());
    EXPECT_EQ(admin_.Params().minSources, 3u);
}

TEST_F(AdminTest, RejectsZeroAndStrangers) {
    EXPECT_EQ(admin_.PrepareMinSources(owner_, 0).error(), OracleError::InvalidPrice);
    EXPECT_EQ(admin_.PrepareStalenessThreshold(owner_, 0).error(), OracleError::InvalidPrice);
    EXPECT_EQ(admin_.PrepareMinSources(stranger_, 2).error(), OracleError::NotAuthorized);
    EXPECT_EQ(admin_.PrepareStalenessThreshold(stranger_, 2).error(),
              OracleError::NotAuthorized);
}

TEST_F(AdminTest, StalenessThreshold) {
    auto result = admin_.PrepareStalenessThreshold(owner_, 10);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().stalenessThreshold, 10u);
    EXPECT_EQ(result.value().minSources, DEFAULT_MIN_SOURCES);
}

TEST_F(AdminTest, PauseDeactivatesCopy) {
    Principal source = CreateTestAddress(1);
    AssetBook book;
    Quote quote;
    quote.price = 100;
    quote.weight = 10;
    quote.active = true;
    book.Upsert(source, quote);

    auto paused = admin_.PreparePause(owner_, "STX", &book, source);
    ASSERT_TRUE(paused.ok());
    EXPECT_FALSE(paused.value().Find(source)->active);
    EXPECT_EQ(paused.value().Find(source)->price, 100u);
    EXPECT_TRUE(book.Find(source)->active);
}

TEST_F(AdminTest, PauseErrors) {
    Principal source = CreateTestAddress(1);
    AssetBook book;

    EXPECT_EQ(admin_.PreparePause(stranger_, "STX", &book, source).error(),
              OracleError::NotAuthorized);
    EXPECT_EQ(admin_.PreparePause(owner_, "", &book, source).error(),
              OracleError::InvalidAsset);
    EXPECT_EQ(admin_.PreparePause(owner_, "STX", nullptr, source).error(),
              OracleError::SourceNotFound);
    EXPECT_EQ(admin_.PreparePause(owner_, "STX", &book, source).error(),
              OracleError::SourceNotFound);
}

} // namespace
} // namespace oracle
} // namespace pricefeed
