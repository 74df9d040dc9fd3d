// tests/test_file_cache.cpp
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <thread>

#include "gtest/gtest.h"

#include "../src/cache/FileStore.hpp"
#include "../src/core/CacheFactory.hpp"
#include "../src/logging/ConsoleLogger.hpp"
#include "../src/models/CacheErrors.hpp"
#include "test_mocks.hpp"

using namespace std::chrono;
namespace fs = std::filesystem;

namespace {

std::string readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

} // namespace

class FileCacheTest : public ::testing::Test {
protected:
    TempDir dir;
    std::shared_ptr<ILogger> logger = std::make_shared<ConsoleLogger>(LogUtils::LogLevel::CERROR);

    std::shared_ptr<Cache> makeCache(milliseconds ttl) {
        return CacheFactory::newFileCache(ttl, dir.str(), logger);
    }

    std::shared_ptr<Cache> makeLazyCache(milliseconds ttl) {
        auto cache = makeCache(ttl);
        cache->stopSweeper();
        return cache;
    }
};

TEST_F(FileCacheTest, SetWritesOneFilePerKeyWithRawPayload) {
    auto cache = makeCache(seconds(5));
    cache->set("cache_key", "value");

    fs::path file = dir.path() / "cache_key";
    ASSERT_TRUE(fs::exists(file));
    EXPECT_EQ(readFile(file), "\"value\"");
    EXPECT_EQ(cache->get("cache_key"), "\"value\"");
}

TEST_F(FileCacheTest, SetAndGetInt) {
    auto cache = makeCache(seconds(5));
    cache->set("cache_key", 1);
    EXPECT_TRUE(cache->has("cache_key"));
    EXPECT_EQ(cache->getAs<int>("cache_key"), 1);
}

TEST_F(FileCacheTest, SetTruncatesPreviousContent) {
    auto cache = makeCache(seconds(5));
    cache->set("k", "a much longer first value");
    cache->set("k", "short");
    EXPECT_EQ(cache->getAs<std::string>("k"), "short");
}

TEST_F(FileCacheTest, AddConflictsWithLiveFile) {
    auto cache = makeCache(seconds(5));
    cache->add("cache_key", "v1");
    EXPECT_THROW(cache->add("cache_key", "v2"), AlreadyExistsError);
    EXPECT_EQ(cache->getAs<std::string>("cache_key"), "v1");
}

TEST_F(FileCacheTest, GetMissingThrowsNotFound) {
    auto cache = makeCache(seconds(5));
    EXPECT_THROW(cache->get("missing"), NotFoundError);
    EXPECT_FALSE(cache->has("missing"));
}

TEST_F(FileCacheTest, ExpiredFileIsReportedAndRemoved) {
    auto cache = makeLazyCache(seconds(1));
    cache->set("cache_key", "value");
    EXPECT_TRUE(cache->has("cache_key"));

    std::this_thread::sleep_for(milliseconds(1200));

    EXPECT_THROW(cache->get("cache_key"), ExpiredError);
    EXPECT_FALSE(fs::exists(dir.path() / "cache_key"));
    EXPECT_THROW(cache->get("cache_key"), NotFoundError);
}

TEST_F(FileCacheTest, FreshnessFollowsModificationTime) {
    auto cache = makeLazyCache(seconds(60));
    cache->set("cache_key", "value");

    // Backdating the file ages the entry out.
    fs::last_write_time(dir.path() / "cache_key", fs::file_time_type::clock::now() - minutes(5));

    EXPECT_FALSE(cache->has("cache_key"));
    EXPECT_FALSE(fs::exists(dir.path() / "cache_key"));
}

TEST_F(FileCacheTest, PullRemovesFile) {
    auto cache = makeCache(seconds(5));
    cache->set("cache_key", "value");
    EXPECT_EQ(cache->pullAs<std::string>("cache_key"), "value");
    EXPECT_FALSE(fs::exists(dir.path() / "cache_key"));
    EXPECT_THROW(cache->pull("cache_key"), NotFoundError);
}

TEST_F(FileCacheTest, ZeroTtlNeverExpires) {
    auto cache = makeCache(milliseconds(0));
    EXPECT_EQ(cache->sweeper(), nullptr);
    cache->set("k", 1);
    fs::last_write_time(dir.path() / "k", fs::file_time_type::clock::now() - hours(24 * 365));
    EXPECT_EQ(cache->getAs<int>("k"), 1);
}

TEST_F(FileCacheTest, DeleteAndFlush) {
    auto cache = makeCache(seconds(5));
    EXPECT_NO_THROW(cache->remove("missing"));

    cache->set("a", 1);
    cache->set("b", 2);
    cache->remove("a");
    EXPECT_FALSE(fs::exists(dir.path() / "a"));

    cache->flush();
    EXPECT_FALSE(cache->has("b"));
    EXPECT_FALSE(fs::exists(dir.path() / "b"));
    EXPECT_NO_THROW(cache->flush());
}

TEST_F(FileCacheTest, FlushLeavesForeignFilesAlone) {
    auto cache = makeCache(seconds(5));
    std::ofstream(dir.path() / "foreign") << "not ours";
    cache->set("ours", 1);
    cache->flush();
    EXPECT_TRUE(fs::exists(dir.path() / "foreign"));
    EXPECT_FALSE(fs::exists(dir.path() / "ours"));
}

TEST_F(FileCacheTest, MissingDirectoryFailsWritesWithIOError) {
    auto cache = CacheFactory::newFileCache(seconds(5), (dir.path() / "does" / "not" / "exist").string(), logger);
    EXPECT_THROW(cache->set("k", 1), IOError);
    EXPECT_FALSE(cache->has("k"));
}

TEST_F(FileCacheTest, KeysThatCannotNameAFileAreRejected) {
    auto cache = makeCache(seconds(5));
    EXPECT_THROW(cache->set("nested/key", 1), IOError);
    EXPECT_THROW(cache->set("..", 1), IOError);
    EXPECT_FALSE(cache->has("nested/key"));
    EXPECT_THROW(cache->get(".."), NotFoundError);
}

TEST(FileStoreTest, FileDeletedOutsideTheCacheIsForgotten) {
    TempDir dir;
    auto logger = std::make_shared<ConsoleLogger>(LogUtils::LogLevel::CERROR);
    FileStore store(ExpirationPolicy(seconds(5)), dir.str(), logger);
    store.write("kept", "1");
    store.write("deleted_outside", "2");
    ASSERT_EQ(store.keys().size(), 2u);

    fs::remove(dir.path() / "deleted_outside");
    EXPECT_FALSE(store.stat("deleted_outside").has_value());

    auto keys = store.keys();
    ASSERT_EQ(keys.size(), 1u);
    EXPECT_EQ(keys[0], "kept");
    EXPECT_TRUE(store.stat("kept").has_value());
}

TEST(FileStoreTest, PathForJoinsBaseDirAndKey) {
    auto logger = std::make_shared<ConsoleLogger>(LogUtils::LogLevel::CERROR);
    FileStore with_slash(ExpirationPolicy(seconds(1)), "/tmp/cache/", logger);
    FileStore without_slash(ExpirationPolicy(seconds(1)), "/tmp/cache", logger);
    EXPECT_EQ(*with_slash.pathFor("k"), "/tmp/cache/k");
    EXPECT_EQ(*without_slash.pathFor("k"), "/tmp/cache/k");
    EXPECT_FALSE(without_slash.pathFor("").has_value());
}
