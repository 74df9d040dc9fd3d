// tests/test_cache_facade.cpp
// Facade semantics against a mocked store: dispatch, staleness, metrics.
#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "../src/core/Cache.hpp"
#include "../src/models/CacheErrors.hpp"
#include "test_mocks.hpp"

using namespace std::chrono;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

class CacheFacadeTest : public ::testing::Test {
protected:
    std::shared_ptr<NiceMock<MockLogger>> logger = std::make_shared<NiceMock<MockLogger>>();
    std::shared_ptr<NiceMock<MockStatsDClient>> statsd = std::make_shared<NiceMock<MockStatsDClient>>();
    MockBackendStore* store = nullptr; // Owned by the cache

    // Store that expires natively, so no sweeper is started.
    std::unique_ptr<Cache> makeCache(milliseconds ttl = seconds(10)) {
        auto mock = std::make_unique<NiceMock<MockBackendStore>>();
        store = mock.get();
        ON_CALL(*store, kind()).WillByDefault(Return(BackendKind::Redis));
        ON_CALL(*store, expiresNatively()).WillByDefault(Return(true));
        return std::make_unique<Cache>(std::move(mock), ExpirationPolicy(ttl), logger, statsd);
    }

    static ExpirationPolicy::TimePoint past() { return ExpirationPolicy::Clock::now() - seconds(1); }
    static ExpirationPolicy::TimePoint future() { return ExpirationPolicy::Clock::now() + hours(1); }
};

TEST_F(CacheFacadeTest, SetEncodesAndWrites) {
    auto cache = makeCache();
    EXPECT_CALL(*store, write("k", "\"v\""));
    EXPECT_CALL(*statsd, increment(MetricsDefinitions::CACHE_WRITE, 1));
    cache->set("k", "v");
}

TEST_F(CacheFacadeTest, SetDoesNotWriteWhenEncodingFails) {
    auto cache = makeCache();
    EXPECT_CALL(*store, write(_, _)).Times(0);
    EXPECT_THROW(cache->set("k", std::string("\xc3\x28")), EncodingError);
}

TEST_F(CacheFacadeTest, AddChecksThenWrites) {
    auto cache = makeCache();
    EXPECT_CALL(*store, stat("k")).WillOnce(Return(std::nullopt));
    EXPECT_CALL(*store, write("k", "1"));
    cache->add("k", 1);
}

TEST_F(CacheFacadeTest, AddOnLiveEntryThrowsWithoutWriting) {
    auto cache = makeCache();
    EXPECT_CALL(*store, stat("k")).WillOnce(Return(EntryStamp{future()}));
    EXPECT_CALL(*store, write(_, _)).Times(0);
    EXPECT_CALL(*statsd, increment(MetricsDefinitions::CACHE_ADD_CONFLICT, 1));
    EXPECT_THROW(cache->add("k", 1), AlreadyExistsError);
}

TEST_F(CacheFacadeTest, AddOverStaleEntryEvictsThenWrites) {
    auto cache = makeCache();
    EXPECT_CALL(*store, stat("k")).WillOnce(Return(EntryStamp{past()}));
    EXPECT_CALL(*store, remove("k"));
    EXPECT_CALL(*store, write("k", "2"));
    cache->add("k", 2);
}

TEST_F(CacheFacadeTest, GetReturnsPayloadWithoutRemoving) {
    auto cache = makeCache();
    EXPECT_CALL(*store, read("k")).WillOnce(Return(StoredEntry{"\"v\"", future()}));
    EXPECT_CALL(*store, remove(_)).Times(0);
    EXPECT_CALL(*statsd, increment(MetricsDefinitions::CACHE_HIT, 1));
    EXPECT_EQ(cache->get("k"), "\"v\"");
}

TEST_F(CacheFacadeTest, GetMissingThrowsNotFound) {
    auto cache = makeCache();
    EXPECT_CALL(*store, read("k")).WillOnce(Return(std::nullopt));
    EXPECT_CALL(*statsd, increment(MetricsDefinitions::CACHE_MISS, 1));
    EXPECT_THROW(cache->get("k"), NotFoundError);
}

TEST_F(CacheFacadeTest, GetStaleThrowsExpiredAndEvicts) {
    auto cache = makeCache();
    EXPECT_CALL(*store, read("k")).WillOnce(Return(StoredEntry{"1", past()}));
    EXPECT_CALL(*store, remove("k"));
    EXPECT_CALL(*statsd, increment(MetricsDefinitions::CACHE_EXPIRED, 1));
    EXPECT_THROW(cache->get("k"), ExpiredError);
}

TEST_F(CacheFacadeTest, EntryWithoutExpiryIsNeverStale) {
    auto cache = makeCache();
    EXPECT_CALL(*store, read("k")).WillOnce(Return(StoredEntry{"1", std::nullopt}));
    EXPECT_EQ(cache->getAs<int>("k"), 1);
}

TEST_F(CacheFacadeTest, PullRemovesAfterRead) {
    auto cache = makeCache();
    EXPECT_CALL(*store, read("k")).WillOnce(Return(StoredEntry{"1", future()}));
    EXPECT_CALL(*store, remove("k"));
    EXPECT_EQ(cache->pullAs<int>("k"), 1);
}

TEST_F(CacheFacadeTest, GetAsWrongShapeThrowsDecodingError) {
    auto cache = makeCache();
    EXPECT_CALL(*store, read("k")).WillOnce(Return(StoredEntry{"\"text\"", std::nullopt}));
    EXPECT_THROW(cache->getAs<int>("k"), DecodingError);
}

TEST_F(CacheFacadeTest, HasNeverThrows) {
    auto cache = makeCache();
    EXPECT_CALL(*store, stat("k")).WillOnce(Throw(ConnectionError("redis went away")));
    EXPECT_CALL(*logger, error(_));
    EXPECT_FALSE(cache->has("k"));
}

TEST_F(CacheFacadeTest, WriteErrorsPropagate) {
    auto cache = makeCache();
    EXPECT_CALL(*store, write("k", _)).WillOnce(Throw(IOError("permission denied")));
    EXPECT_THROW(cache->set("k", 1), IOError);
}

TEST_F(CacheFacadeTest, DeleteAndFlushDelegate) {
    auto cache = makeCache();
    EXPECT_CALL(*store, remove("k"));
    EXPECT_CALL(*store, flush());
    cache->remove("k");
    cache->flush();
}

TEST_F(CacheFacadeTest, NoSweeperWhenStoreExpiresNatively) {
    auto cache = makeCache(seconds(1));
    EXPECT_EQ(cache->sweeper(), nullptr);
}

TEST(CacheFacadeConstructionTest, NullCollaboratorsAreRejected) {
    auto logger = std::make_shared<NiceMock<MockLogger>>();
    auto statsd = std::make_shared<NiceMock<MockStatsDClient>>();
    EXPECT_THROW(Cache(nullptr, ExpirationPolicy(seconds(1)), logger, statsd), std::invalid_argument);
    EXPECT_THROW(Cache(std::make_unique<NiceMock<MockBackendStore>>(), ExpirationPolicy(seconds(1)), nullptr, statsd),
                 std::invalid_argument);
}

TEST(CacheFacadeConstructionTest, LocalStoreWithTtlArmsSweeper) {
    auto logger = std::make_shared<NiceMock<MockLogger>>();
    auto statsd = std::make_shared<NiceMock<MockStatsDClient>>();
    auto mock = std::make_unique<NiceMock<MockBackendStore>>();
    ON_CALL(*mock, kind()).WillByDefault(Return(BackendKind::Memory));
    ON_CALL(*mock, expiresNatively()).WillByDefault(Return(false));

    Cache cache(std::move(mock), ExpirationPolicy(seconds(30)), logger, statsd);
    ASSERT_NE(cache.sweeper(), nullptr);
    EXPECT_EQ(cache.sweeper()->state(), SweeperState::Armed);
    EXPECT_EQ(cache.sweeper()->interval(), seconds(30));

    cache.stopSweeper();
    EXPECT_EQ(cache.sweeper()->state(), SweeperState::Terminated);
}
