#include "gtest/gtest.h"
#include "storage/chunk_store.hpp"
#include "test_helpers.hpp"
#include "utilities/chunk_hasher.hpp"
#include "utilities/errors.hpp"
#include <filesystem>
#include <fstream>
#include <set>
#include <string>
#include <vector>

using namespace chunkvault;
namespace fs = std::filesystem;

namespace {

struct StoreFixture {
    explicit StoreFixture(size_t backends = 9, size_t k = 6, size_t m = 3)
        : dir("store"),
          health(std::make_shared<BackendHealthCache>()),
          store(testutil::makeBackends(dir, backends),
                std::make_shared<ReedSolomonCoder>(k, m), Compressor(3), 2, health) {}

    testutil::TempDir dir;
    std::shared_ptr<BackendHealthCache> health;
    ChunkStore store;
};

ChunkMeta putBytes(ChunkStore& store, const std::vector<std::byte>& data) {
    return store.putChunk(ChunkHasher::hash(data), data);
}

// Overwrite the start of a shard file while keeping its size.
void flipBytes(const std::string& path) {
    std::fstream shard(path, std::ios::in | std::ios::out | std::ios::binary);
    char head[4] = {};
    shard.read(head, sizeof(head));
    for (char& c : head) c = static_cast<char>(~c);
    shard.seekp(0);
    shard.write(head, sizeof(head));
}

} // namespace

TEST(ChunkStoreTest, PutAndGetChunk) {
    StoreFixture f;
    std::vector<std::byte> data = testutil::bytesOf("hello");
    ChunkMeta meta = putBytes(f.store, data);

    EXPECT_EQ(meta.digest, ChunkHasher::hash(data));
    EXPECT_EQ(meta.sizeBytes, data.size());
    EXPECT_EQ(meta.dataShards, 6u);
    EXPECT_EQ(meta.parityShards, 3u);
    EXPECT_EQ(meta.tier, StorageTier::Hot);
    ASSERT_EQ(meta.shardLocations.size(), 9u);

    std::vector<std::byte> out = f.store.getChunk(meta);
    EXPECT_EQ(testutil::stringOf(out), "hello");
}

TEST(ChunkStoreTest, ShardLayoutFollowsDigestPrefix) {
    StoreFixture f;
    auto data = testutil::randomBytes(10000, 2);
    ChunkMeta meta = putBytes(f.store, data);

    std::set<std::string> backends;
    for (size_t i = 0; i < meta.shardLocations.size(); ++i) {
        const auto& loc = meta.shardLocations[i];
        EXPECT_EQ(loc.shardIndex, i);
        std::string expectedTail = meta.digest.substr(0, 2) + "/" + meta.digest + "." +
                                   std::to_string(i) + ".shard";
        EXPECT_EQ(loc.storagePath.substr(loc.storagePath.size() - expectedTail.size()),
                  expectedTail);
        EXPECT_TRUE(fs::exists(loc.storagePath));
        backends.insert(loc.backendId);
    }
    // One shard per backend when there are k+m of them.
    EXPECT_EQ(backends.size(), 9u);
}

TEST(ChunkStoreTest, ShardRelativePath) {
    EXPECT_EQ(ChunkStore::shardRelativePath("abcdef", 4, 2), "ab/abcdef.4.shard");
    EXPECT_EQ(ChunkStore::shardRelativePath("abcdef", 0, 3), "abc/abcdef.0.shard");
}

TEST(ChunkStoreTest, CompressesBeforeEncoding) {
    StoreFixture f;
    std::vector<std::byte> data(100000, std::byte{'z'});
    ChunkMeta meta = putBytes(f.store, data);
    EXPECT_LT(meta.compressedSizeBytes, meta.sizeBytes);
    EXPECT_EQ(f.store.getChunk(meta), data);
}

TEST(ChunkStoreTest, SurvivesLossOfParityCountShards) {
    StoreFixture f;
    auto data = testutil::randomBytes(50000, 3);
    ChunkMeta meta = putBytes(f.store, data);
    fs::remove(meta.shardLocations[0].storagePath);
    fs::remove(meta.shardLocations[4].storagePath);
    fs::remove(meta.shardLocations[7].storagePath);
    EXPECT_EQ(f.store.countAvailableShards(meta), 6u);
    EXPECT_EQ(f.store.getChunk(meta), data);
}

TEST(ChunkStoreTest, TooManyLostShards) {
    StoreFixture f;
    auto data = testutil::randomBytes(50000, 4);
    ChunkMeta meta = putBytes(f.store, data);
    for (size_t i : {1u, 2u, 3u, 8u}) fs::remove(meta.shardLocations[i].storagePath);
    try {
        f.store.getChunk(meta);
        FAIL() << "expected InsufficientShards";
    } catch (const VaultException& e) {
        EXPECT_EQ(e.code(), ErrorCode::InsufficientShards);
    }
}

TEST(ChunkStoreTest, CorruptedShardIsSkipped) {
    StoreFixture f(3, 2, 1);
    auto data = testutil::randomBytes(3000, 5);
    ChunkMeta meta = putBytes(f.store, data);
    for (const auto& loc : meta.shardLocations) EXPECT_EQ(loc.checksum.size(), 64u);

    flipBytes(meta.shardLocations[0].storagePath);
    EXPECT_EQ(f.store.getChunk(meta), data);
    EXPECT_EQ(f.store.countAvailableShards(meta), 2u);
}

TEST(ChunkStoreTest, CorruptionBeyondParityCountFails) {
    StoreFixture f(5, 3, 2);
    auto data = testutil::randomBytes(6000, 15);
    ChunkMeta meta = putBytes(f.store, data);
    flipBytes(meta.shardLocations[0].storagePath);
    flipBytes(meta.shardLocations[3].storagePath);
    EXPECT_EQ(f.store.getChunk(meta), data);

    flipBytes(meta.shardLocations[4].storagePath);
    try {
        f.store.getChunk(meta);
        FAIL() << "expected InsufficientShards";
    } catch (const VaultException& e) {
        EXPECT_EQ(e.code(), ErrorCode::InsufficientShards);
    }
}

TEST(ChunkStoreTest, RepairRewritesCorruptedShards) {
    StoreFixture f;
    auto data = testutil::randomBytes(20000, 16);
    ChunkMeta meta = putBytes(f.store, data);
    flipBytes(meta.shardLocations[1].storagePath);
    EXPECT_EQ(f.store.countAvailableShards(meta), 8u);
    EXPECT_EQ(f.store.repairChunk(meta), 1u);
    EXPECT_EQ(f.store.countAvailableShards(meta), 9u);
}

TEST(ChunkStoreTest, UnusableShardCountsAreCorruption) {
    StoreFixture f;
    ChunkMeta meta = putBytes(f.store, testutil::bytesOf("shard counts"));
    meta.dataShards = 0;
    try {
        f.store.getChunk(meta);
        FAIL() << "expected CorruptedChunk";
    } catch (const VaultException& e) {
        EXPECT_EQ(e.code(), ErrorCode::CorruptedChunk);
    }
}

TEST(ChunkStoreTest, RepairRewritesMissingShards) {
    StoreFixture f;
    auto data = testutil::randomBytes(20000, 6);
    ChunkMeta meta = putBytes(f.store, data);
    fs::remove(meta.shardLocations[2].storagePath);
    fs::remove(meta.shardLocations[6].storagePath);

    EXPECT_EQ(f.store.repairChunk(meta), 2u);
    EXPECT_EQ(f.store.countAvailableShards(meta), 9u);
    EXPECT_EQ(f.store.repairChunk(meta), 0u);

    // Any three other shards can now go missing.
    fs::remove(meta.shardLocations[0].storagePath);
    fs::remove(meta.shardLocations[1].storagePath);
    fs::remove(meta.shardLocations[3].storagePath);
    EXPECT_EQ(f.store.getChunk(meta), data);
}

TEST(ChunkStoreTest, RemoveChunkDeletesShardFiles) {
    StoreFixture f;
    ChunkMeta meta = putBytes(f.store, testutil::bytesOf("to be removed"));
    EXPECT_EQ(f.store.removeChunk(meta), 9u);
    for (const auto& loc : meta.shardLocations) EXPECT_FALSE(fs::exists(loc.storagePath));
}

TEST(ChunkStoreTest, FewerBackendsThanShards) {
    StoreFixture f(2, 4, 2);
    auto data = testutil::randomBytes(4000, 8);
    ChunkMeta meta = putBytes(f.store, data);
    EXPECT_EQ(meta.shardLocations.size(), 6u);
    EXPECT_EQ(f.store.getChunk(meta), data);
}

TEST(ChunkStoreTest, ReadsChunksWrittenWithOtherParameters) {
    testutil::TempDir dir("store");
    auto backends = testutil::makeBackends(dir, 5);
    ChunkStore oldStore(backends, std::make_shared<ReedSolomonCoder>(3, 2), Compressor(3));
    auto data = testutil::randomBytes(7000, 10);
    ChunkMeta meta = putBytes(oldStore, data);

    ChunkStore newStore(backends, std::make_shared<ReedSolomonCoder>(4, 1), Compressor(3));
    EXPECT_EQ(newStore.getChunk(meta), data);
}

TEST(ChunkStoreTest, MissingShardsDemoteBackendHealth) {
    StoreFixture f;
    auto data = testutil::randomBytes(9000, 12);
    ChunkMeta meta = putBytes(f.store, data);
    const std::string victim = meta.shardLocations[0].backendId;
    fs::remove(meta.shardLocations[0].storagePath);
    EXPECT_EQ(f.store.countAvailableShards(meta), 8u);
    EXPECT_NE(f.health->state(victim), BackendState::ALIVE);
}
