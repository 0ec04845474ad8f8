// PRICEFEED - State Store Tests
// Copyright (c) 2024 PRICEFEED Developers
// MIT License

#include <gtest/gtest.h>

#include "pricefeed/db/database.h"
#include "pricefeed/db/leveldb.h"
#include "pricefeed/oracle/engine.h"
#include "pricefeed/oracle/state_store.h"

#include <array>

namespace pricefeed {
namespace oracle {
namespace {

// ============================================================================
// Test Fixtures
// ============================================================================

/// Memory database whose batch writes can be made to fail
class FailingDatabase : public db::MemoryDatabase {
public:
    using db::MemoryDatabase::Write;

    bool failWrites{false};

    db::Status Write(const db::WriteOptions& options, db::WriteBatch* batch) override {
        if (failWrites) {
            return db::Status::IOError("disk full");
        }
        return db::MemoryDatabase::Write(options, batch);
    }
};

class StateStoreTest : public ::testing::Test {
protected:
    Principal owner_ = CreateTestAddress(0xAA);
    Principal source1_ = CreateTestAddress(0x01);
    Principal source2_ = CreateTestAddress(0x02);
    ManualClock clock_{100};
    FailingDatabase db_;
    StateStore store_{db_};

    static Principal CreateTestAddress(Byte value) {
        std::array<Byte, 20> data{};
        data.fill(value);
        return Principal(data);
    }

    /// Engine with a little of everything in its tables
    void Populate(PriceFeedEngine& engine) {
        ASSERT_TRUE(engine.AuthorizeSource(owner_, source2_).ok());
        ASSERT_TRUE(engine.AuthorizeSource(owner_, source1_).ok());
        ASSERT_TRUE(engine.Submit(source2_, "STX", 1850000, 50).ok());
        ASSERT_TRUE(engine.Submit(source1_, "STX", 1860000, 25).ok());
        ASSERT_TRUE(engine.Submit(source1_, "USD", 1000000, 100).ok());
        ASSERT_TRUE(engine.PauseSource(owner_, "USD", source1_).ok());
        ASSERT_TRUE(engine.SetStalenessThreshold(owner_, 300).ok());
        ASSERT_TRUE(engine.DeauthorizeSource(owner_, source2_).ok());
    }
};

// ============================================================================
// Attach and Reload
// ============================================================================

TEST_F(StateStoreTest, AttachEmptyWritesParameters) {
    PriceFeedEngine engine(owner_, clock_);
    EXPECT_FALSE(store_.HasState());

    bool restored = true;
    ASSERT_TRUE(engine.AttachStore(store_, &restored).ok());
    EXPECT_FALSE(restored);
    EXPECT_TRUE(store_.HasState());

    PersistedState state;
    ASSERT_TRUE(store_.Load(state).ok());
    EXPECT_EQ(state.params.minSources, DEFAULT_MIN_SOURCES);
    EXPECT_EQ(state.params.stalenessThreshold, DEFAULT_STALENESS_THRESHOLD);
    EXPECT_TRUE(state.sources.empty());
    EXPECT_TRUE(state.books.empty());
}

TEST_F(StateStoreTest, ReloadReproducesEngine) {
    PriceFeedEngine first(owner_, clock_);
    ASSERT_TRUE(first.AttachStore(store_).ok());
    Populate(first);

    PriceFeedEngine second(owner_, clock_);
    StateStore reopened(db_);
    bool restored = false;
    ASSERT_TRUE(second.AttachStore(reopened, &restored).ok());
    EXPECT_TRUE(restored);

    EXPECT_EQ(second.AuthorizedSources(), first.AuthorizedSources());
    EXPECT_FALSE(second.IsAuthorized(source2_));
    EXPECT_EQ(second.StalenessThreshold(), 300u);
    EXPECT_EQ(second.MinSources(), first.MinSources());
    EXPECT_EQ(second.Assets(), first.Assets());

    for (const auto& asset : first.Assets()) {
        EXPECT_EQ(second.GetPriceData(asset), first.GetPriceData(asset)) << asset;
        for (const auto& source : {source1_, source2_}) {
            EXPECT_EQ(second.GetSourceQuote(asset, source), first.GetSourceQuote(asset, source));
        }
    }
    EXPECT_FALSE(second.GetSourceQuote("USD", source1_)->active);

    // Registration order survives the reload
    PersistedState state;
    ASSERT_TRUE(reopened.Load(state).ok());
    std::vector<Principal> order = {source2_, source1_};
    EXPECT_EQ(state.books.at("STX").Sources(), order);

    // Authorization order and sequence numbers continue where they left off
    ASSERT_TRUE(second.AuthorizeSource(owner_, source2_).ok());
    std::vector<Principal> expected = {source1_, source2_};
    EXPECT_EQ(second.AuthorizedSources(), expected);
}

TEST_F(StateStoreTest, StoredParametersWin) {
    {
        PriceFeedEngine engine(owner_, clock_);
        ASSERT_TRUE(engine.AttachStore(store_).ok());
        ASSERT_TRUE(engine.SetMinSources(owner_, 4).ok());
    }

    AggregationParams params;
    params.minSources = 2;
    params.stalenessThreshold = 10;
    PriceFeedEngine engine(owner_, clock_, params);
    ASSERT_TRUE(engine.AttachStore(store_).ok());
    EXPECT_EQ(engine.MinSources(), 4u);
    EXPECT_EQ(engine.StalenessThreshold(), DEFAULT_STALENESS_THRESHOLD);
}

TEST_F(StateStoreTest, ZeroConstructionParametersFallBackToDefaults) {
    AggregationParams params;
    params.minSources = 0;
    params.stalenessThreshold = 0;
    {
        PriceFeedEngine engine(owner_, clock_, params);
        EXPECT_EQ(engine.MinSources(), DEFAULT_MIN_SOURCES);
        EXPECT_EQ(engine.StalenessThreshold(), DEFAULT_STALENESS_THRESHOLD);
        ASSERT_TRUE(engine.AttachStore(store_).ok());
    }

    PriceFeedEngine reloaded(owner_, clock_);
    StateStore reopened(db_);
    bool restored = false;
    ASSERT_TRUE(reloaded.AttachStore(reopened, &restored).ok());
    EXPECT_TRUE(restored);
    EXPECT_EQ(reloaded.MinSources(), DEFAULT_MIN_SOURCES);
    EXPECT_EQ(reloaded.StalenessThreshold(), DEFAULT_STALENESS_THRESHOLD);
}

// ============================================================================
// Height
// ============================================================================

TEST_F(StateStoreTest, HeightIsRecordedWithEachWrite) {
    ManualClock clock(1000);
    PriceFeedEngine engine(owner_, clock);
    ASSERT_TRUE(engine.AttachStore(store_).ok());

    Height stored = 0;
    ASSERT_TRUE(store_.StoredHeight(stored).ok());
    EXPECT_EQ(stored, 1000u);

    ASSERT_TRUE(engine.AuthorizeSource(owner_, source1_).ok());
    clock.Advance(50);
    ASSERT_TRUE(engine.Submit(source1_, "STX", 1850000, 50).ok());
    ASSERT_TRUE(store_.StoredHeight(stored).ok());
    EXPECT_EQ(stored, 1050u);

    // Reads alone do not write; PersistHeight records the clock explicitly
    clock.Advance(10);
    EXPECT_TRUE(engine.GetPrice("STX").ok());
    ASSERT_TRUE(store_.StoredHeight(stored).ok());
    EXPECT_EQ(stored, 1050u);
    ASSERT_TRUE(engine.PersistHeight().ok());
    ASSERT_TRUE(store_.StoredHeight(stored).ok());
    EXPECT_EQ(stored, 1060u);
    EXPECT_EQ(engine.HighestHeight(), 1060u);
}

TEST_F(StateStoreTest, StalePriceStaysStaleAcrossReattach) {
    {
        ManualClock clock(1000);
        PriceFeedEngine engine(owner_, clock);
        ASSERT_TRUE(engine.AttachStore(store_).ok());
        ASSERT_TRUE(engine.AuthorizeSource(owner_, source1_).ok());
        ASSERT_TRUE(engine.Submit(source1_, "STX", 1850000, 50).ok());
    }

    {
        ManualClock clock(1200);
        PriceFeedEngine engine(owner_, clock);
        StateStore reopened(db_);
        ASSERT_TRUE(engine.AttachStore(reopened).ok());
        EXPECT_EQ(engine.GetPrice("STX").error(), OracleError::StalePrice);
        EXPECT_FALSE(engine.IsPriceFresh("STX"));
    }

    // A clock behind the recorded height cannot attach, so the stale
    // aggregate is never served as fresh
    for (Height height : {Height(0), Height(10), Height(1100)}) {
        ManualClock clock(height);
        PriceFeedEngine engine(owner_, clock);
        StateStore reopened(db_);
        bool restored = true;
        db::Status s = engine.AttachStore(reopened, &restored);
        EXPECT_TRUE(s.IsInvalidArgument()) << height << ": " << s.ToString();
        EXPECT_FALSE(restored);
        EXPECT_FALSE(engine.GetPriceData("STX").has_value());
    }

    Height stored = 0;
    ASSERT_TRUE(store_.StoredHeight(stored).ok());
    EXPECT_EQ(stored, 1200u);
}

TEST_F(StateStoreTest, StoredHeightMissingIsNotFound) {
    Height stored = 7;
    EXPECT_TRUE(store_.StoredHeight(stored).IsNotFound());
    EXPECT_EQ(stored, 7u);
}

// ============================================================================
// Write Failures
// ============================================================================

TEST_F(StateStoreTest, FailedWriteLeavesEngineUntouched) {
    PriceFeedEngine engine(owner_, clock_);
    ASSERT_TRUE(engine.AttachStore(store_).ok());
    ASSERT_TRUE(engine.AuthorizeSource(owner_, source1_).ok());
    ASSERT_TRUE(engine.Submit(source1_, "STX", 100, 10).ok());
    auto before = engine.GetPriceData("STX");

    db_.failWrites = true;

    auto submit = engine.Submit(source1_, "STX", 200, 10);
    ASSERT_FALSE(submit.ok());
    EXPECT_EQ(submit.error(), OracleError::StorageError);
    EXPECT_EQ(engine.GetPriceData("STX"), before);
    EXPECT_EQ(engine.GetSourceQuote("STX", source1_)->price, 100u);

    EXPECT_EQ(engine.AuthorizeSource(owner_, source2_).error(), OracleError::StorageError);
    EXPECT_FALSE(engine.IsAuthorized(source2_));

    EXPECT_EQ(engine.SetMinSources(owner_, 3).error(), OracleError::StorageError);
    EXPECT_EQ(engine.MinSources(), DEFAULT_MIN_SOURCES);

    EXPECT_EQ(engine.PauseSource(owner_, "STX", source1_).error(), OracleError::StorageError);
    EXPECT_TRUE(engine.GetSourceQuote("STX", source1_)->active);

    // Rejections are still reported before any write
    EXPECT_EQ(engine.Submit(source2_, "STX", 200, 10).error(), OracleError::NotAuthorized);

    db_.failWrites = false;
    ASSERT_TRUE(engine.Submit(source1_, "STX", 200, 10).ok());
    EXPECT_EQ(engine.GetPriceData("STX")->price, 200u);
}

TEST_F(StateStoreTest, AttachFailsWhenInitialWriteFails) {
    db_.failWrites = true;
    PriceFeedEngine engine(owner_, clock_);
    db::Status s = engine.AttachStore(store_);
    EXPECT_TRUE(s.IsIOError());
}

// ============================================================================
// Corruption
// ============================================================================

class StateStoreCorruptionTest : public StateStoreTest {
protected:
    void SetUp() override {
        PriceFeedEngine engine(owner_, clock_);
        ASSERT_TRUE(engine.AttachStore(store_).ok());
        ASSERT_TRUE(engine.AuthorizeSource(owner_, source1_).ok());
        ASSERT_TRUE(engine.Submit(source1_, "STX", 100, 10).ok());
    }

    db::Status Reload() {
        PriceFeedEngine engine(owner_, clock_);
        return engine.AttachStore(store_);
    }
};

TEST_F(StateStoreCorruptionTest, CleanStateLoads) {
    EXPECT_TRUE(Reload().ok());
}

TEST_F(StateStoreCorruptionTest, UnknownPrefix) {
    ASSERT_TRUE(db_.Put(std::string("Zjunk"), std::string("x")).ok());
    EXPECT_TRUE(Reload().IsCorruption());
}

TEST_F(StateStoreCorruptionTest, TruncatedParameter) {
    ASSERT_TRUE(db_.Put(db::MakeKey(db::prefix::PARAM, std::string(StateStore::PARAM_STALENESS)),
                        std::string("\x01", 1)).ok());
    EXPECT_TRUE(Reload().IsCorruption());
}

TEST_F(StateStoreCorruptionTest, ZeroParameter) {
    ASSERT_TRUE(db_.Put(db::MakeKey(db::prefix::PARAM, std::string(StateStore::PARAM_MIN_SOURCES)),
                        db::SerializeToString(uint64_t(0))).ok());
    EXPECT_TRUE(Reload().IsCorruption());
}

TEST_F(StateStoreCorruptionTest, QuoteWithoutOrder) {
    ASSERT_TRUE(db_.Delete(db::MakeKey(db::prefix::SOURCE_ORDER, std::string("STX"))).ok());
    EXPECT_TRUE(Reload().IsCorruption());
}

TEST_F(StateStoreCorruptionTest, OrderWithoutQuote) {
    ASSERT_TRUE(db_.Delete(db::MakeKey(db::prefix::QUOTE, std::string("STX"), source1_)).ok());
    EXPECT_TRUE(Reload().IsCorruption());
}

TEST_F(StateStoreCorruptionTest, QuoteOutOfRange) {
    Quote quote;
    quote.price = 100;
    quote.weight = 101;
    quote.active = true;
    db::WriteBatch batch;
    StateStore::StageQuote(batch, "STX", source1_, quote);
    ASSERT_TRUE(store_.Commit(batch).ok());
    EXPECT_TRUE(Reload().IsCorruption());
}

} // namespace
} // namespace oracle
} // namespace pricefeed
