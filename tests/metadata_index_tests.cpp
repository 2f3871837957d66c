#include "gtest/gtest.h"
#include "metadata/metadata_index.hpp"
#include "test_helpers.hpp"
#include "utilities/errors.hpp"
#include <atomic>
#include <fstream>
#include <functional>
#include <thread>
#include <vector>

using namespace chunkvault;

namespace {

ChunkMeta sampleMeta(const std::string& digest, uint64_t size = 100) {
    ChunkMeta meta;
    meta.digest = digest;
    meta.sizeBytes = size;
    meta.compressedSizeBytes = size / 2;
    meta.dataShards = 2;
    meta.parityShards = 1;
    for (size_t i = 0; i < 3; ++i) {
        meta.shardLocations.push_back(
            ShardLocation{i, "/disk" + std::to_string(i) + "/" + digest, "disk" + std::to_string(i)});
    }
    meta.createdAt = SystemClock::time_point(std::chrono::seconds(1700000000));
    meta.lastAccessedAt = meta.createdAt;
    return meta;
}

/// Manifest opened by upload "up".
void openManifest(InMemoryMetadataIndex& index, const std::string& objectId, uint64_t version) {
    index.openManifest(objectId, version, "up");
}

ErrorCode codeOf(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const VaultException& e) {
        return e.code();
    }
    return ErrorCode::None;
}

} // namespace

TEST(MetadataIndexTest, InsertIfAbsentAndLookup) {
    InMemoryMetadataIndex index;
    EXPECT_FALSE(index.lookup("d1").has_value());
    EXPECT_EQ(index.insertIfAbsent(sampleMeta("d1", 100)), InsertOutcome::Inserted);
    EXPECT_EQ(index.insertIfAbsent(sampleMeta("d1", 999)), InsertOutcome::AlreadyExists);
    auto meta = index.lookup("d1");
    ASSERT_TRUE(meta.has_value());
    EXPECT_EQ(meta->sizeBytes, 100u); // first writer wins
    EXPECT_EQ(index.chunkCount(), 1u);
}

TEST(MetadataIndexTest, ConcurrentInsertIfAbsentHasOneWinner) {
    InMemoryMetadataIndex index;
    std::atomic<int> inserted{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 200; ++i) {
                if (index.insertIfAbsent(sampleMeta("digest" + std::to_string(i))) ==
                    InsertOutcome::Inserted) {
                    ++inserted;
                }
            }
        });
    }
    for (auto& th : threads) th.join();
    EXPECT_EQ(inserted.load(), 200);
    EXPECT_EQ(index.chunkCount(), 200u);
}

TEST(MetadataIndexTest, TierTouchAndRemove) {
    InMemoryMetadataIndex index;
    index.insertIfAbsent(sampleMeta("d"));
    EXPECT_TRUE(index.updateTier("d", StorageTier::Cold));
    EXPECT_EQ(index.lookup("d")->tier, StorageTier::Cold);

    auto later = SystemClock::time_point(std::chrono::seconds(1800000000));
    EXPECT_TRUE(index.touch("d", later));
    EXPECT_EQ(index.lookup("d")->lastAccessedAt, later);
    // Touch never moves the access time backwards.
    EXPECT_TRUE(index.touch("d", SystemClock::time_point(std::chrono::seconds(1))));
    EXPECT_EQ(index.lookup("d")->lastAccessedAt, later);

    EXPECT_FALSE(index.updateTier("missing", StorageTier::Hot));
    EXPECT_FALSE(index.touch("missing", later));
    EXPECT_TRUE(index.removeChunk("d"));
    EXPECT_FALSE(index.removeChunk("d"));
    EXPECT_TRUE(index.listChunks().empty());
}

TEST(MetadataIndexTest, ManifestAppendIsIdempotentAndOrdered) {
    InMemoryMetadataIndex index;
    openManifest(index, "obj", 1);
    EXPECT_EQ(index.appendManifestEntry("obj", 1, "up", 2, "c"), AppendOutcome::Appended);
    EXPECT_EQ(index.appendManifestEntry("obj", 1, "up", 0, "a"), AppendOutcome::Appended);
    EXPECT_EQ(index.appendManifestEntry("obj", 1, "up", 1, "b"), AppendOutcome::Appended);
    EXPECT_EQ(index.appendManifestEntry("obj", 1, "up", 1, "b"), AppendOutcome::AlreadyPresent);

    ObjectManifest manifest = index.getManifest("obj", 1);
    EXPECT_EQ(manifest.state, ManifestState::Open);
    EXPECT_EQ(manifest.digests(), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(index.manifestEntry("obj", 1, 2).value_or(""), "c");
    EXPECT_FALSE(index.manifestEntry("obj", 1, 5).has_value());
}

TEST(MetadataIndexTest, ConflictingDigestAtSameIndex) {
    InMemoryMetadataIndex index;
    openManifest(index, "obj", 1);
    index.appendManifestEntry("obj", 1, "up", 0, "a");
    EXPECT_EQ(codeOf([&] { index.appendManifestEntry("obj", 1, "up", 0, "other"); }),
              ErrorCode::DuplicateChunkIndex);
    EXPECT_EQ(index.manifestEntry("obj", 1, 0).value_or(""), "a");
}

TEST(MetadataIndexTest, CommitRequiresContiguousEntries) {
    InMemoryMetadataIndex index;
    openManifest(index, "obj", 1);
    index.appendManifestEntry("obj", 1, "up", 0, "a");
    index.appendManifestEntry("obj", 1, "up", 2, "c");
    EXPECT_EQ(codeOf([&] { index.commitManifest("obj", 1, 3); }), ErrorCode::IncompleteUpload);
    EXPECT_EQ(codeOf([&] { index.commitManifest("obj", 1, 2); }), ErrorCode::IncompleteUpload);

    index.appendManifestEntry("obj", 1, "up", 1, "b");
    index.commitManifest("obj", 1, 3);
    EXPECT_EQ(index.getManifest("obj", 1).state, ManifestState::Committed);
    EXPECT_NO_THROW(index.commitManifest("obj", 1, 3));
    EXPECT_EQ(index.latestCommittedVersion("obj").value_or(0), 1u);

    EXPECT_EQ(codeOf([&] { index.appendManifestEntry("obj", 1, "up", 3, "d"); }),
              ErrorCode::ManifestCommitted);
    EXPECT_EQ(codeOf([&] { index.commitManifest("none", 1, 1); }), ErrorCode::ObjectNotFound);
}

TEST(MetadataIndexTest, InvalidManifestReopensOnAppend) {
    InMemoryMetadataIndex index;
    openManifest(index, "obj", 3);
    index.appendManifestEntry("obj", 3, "up", 0, "a");
    index.invalidateManifest("obj", 3);
    EXPECT_EQ(index.getManifest("obj", 3).state, ManifestState::Invalid);
    EXPECT_FALSE(index.manifestEntry("obj", 3, 0).has_value());

    EXPECT_EQ(index.appendManifestEntry("obj", 3, "up", 0, "z"), AppendOutcome::Appended);
    ObjectManifest manifest = index.getManifest("obj", 3);
    EXPECT_EQ(manifest.state, ManifestState::Open);
    EXPECT_EQ(manifest.digests(), (std::vector<std::string>{"z"}));
}

TEST(MetadataIndexTest, DiscardLeavesCommittedManifests) {
    InMemoryMetadataIndex index;
    openManifest(index, "obj", 1);
    openManifest(index, "obj", 2);
    index.appendManifestEntry("obj", 1, "up", 0, "a");
    index.commitManifest("obj", 1, 1);
    index.appendManifestEntry("obj", 2, "up", 0, "b");

    index.discardManifest("obj", 2);
    index.discardManifest("obj", 1);
    EXPECT_EQ(codeOf([&] { index.getManifest("obj", 2); }), ErrorCode::ObjectNotFound);
    EXPECT_EQ(index.getManifest("obj", 1).state, ManifestState::Committed);
}

TEST(MetadataIndexTest, LatestCommittedVersionSkipsOpenOnes) {
    InMemoryMetadataIndex index;
    openManifest(index, "obj", 1);
    openManifest(index, "obj", 2);
    openManifest(index, "obj", 10);
    openManifest(index, "obj", 11);
    openManifest(index, "objx", 50);
    EXPECT_FALSE(index.latestCommittedVersion("obj").has_value());
    index.appendManifestEntry("obj", 1, "up", 0, "a");
    index.commitManifest("obj", 1, 1);
    index.appendManifestEntry("obj", 2, "up", 0, "b");
    index.appendManifestEntry("obj", 10, "up", 0, "c");
    index.commitManifest("obj", 10, 1);
    index.appendManifestEntry("obj", 11, "up", 0, "d");
    index.appendManifestEntry("objx", 50, "up", 0, "e");
    index.commitManifest("objx", 50, 1);
    EXPECT_EQ(index.latestCommittedVersion("obj").value_or(0), 10u);
}

TEST(MetadataIndexTest, ReferencedDigestsCoversAllManifests) {
    InMemoryMetadataIndex index;
    openManifest(index, "a", 1);
    openManifest(index, "b", 1);
    index.appendManifestEntry("a", 1, "up", 0, "d1");
    index.commitManifest("a", 1, 1);
    index.appendManifestEntry("b", 1, "up", 0, "d2");
    index.appendManifestEntry("b", 1, "up", 1, "d1");
    auto refs = index.referencedDigests();
    EXPECT_EQ(refs.size(), 2u);
    EXPECT_TRUE(refs.count("d1"));
    EXPECT_TRUE(refs.count("d2"));
}

TEST(MetadataIndexTest, SnapshotRoundTrip) {
    testutil::TempDir dir("index");
    const std::string path = (dir.path() / "nested" / "index.yaml").string();

    InMemoryMetadataIndex index;
    ChunkMeta meta = sampleMeta("d1", 4096);
    meta.tier = StorageTier::Warm;
    meta.shardLocations[0].checksum = std::string(64, 'e');
    index.insertIfAbsent(meta);
    index.insertIfAbsent(sampleMeta("d2"));
    openManifest(index, "obj", 1);
    openManifest(index, "obj", 2);
    index.appendManifestEntry("obj", 1, "up", 0, "d1");
    index.appendManifestEntry("obj", 1, "up", 1, "d2");
    index.commitManifest("obj", 1, 2);
    index.appendManifestEntry("obj", 2, "up", 0, "d2");
    ASSERT_TRUE(index.saveSnapshot(path));

    InMemoryMetadataIndex restored;
    ASSERT_TRUE(restored.loadSnapshot(path));
    EXPECT_EQ(restored.chunkCount(), 2u);
    auto d1 = restored.lookup("d1");
    ASSERT_TRUE(d1.has_value());
    EXPECT_EQ(d1->sizeBytes, 4096u);
    EXPECT_EQ(d1->compressedSizeBytes, 2048u);
    EXPECT_EQ(d1->tier, StorageTier::Warm);
    EXPECT_EQ(d1->createdAt, meta.createdAt);
    ASSERT_EQ(d1->shardLocations.size(), 3u);
    EXPECT_EQ(d1->shardLocations[2].backendId, "disk2");
    EXPECT_EQ(d1->shardLocations[2].storagePath, "/disk2/d1");
    EXPECT_EQ(d1->shardLocations[0].checksum, std::string(64, 'e'));
    EXPECT_TRUE(d1->shardLocations[1].checksum.empty());

    EXPECT_EQ(restored.getManifest("obj", 1).state, ManifestState::Committed);
    EXPECT_EQ(restored.getManifest("obj", 1).digests(), (std::vector<std::string>{"d1", "d2"}));
    EXPECT_EQ(restored.getManifest("obj", 2).state, ManifestState::Open);
    // The owning upload survives a restart.
    EXPECT_EQ(restored.appendManifestEntry("obj", 2, "up", 1, "d1"), AppendOutcome::Appended);
    EXPECT_EQ(codeOf([&] { restored.appendManifestEntry("obj", 2, "other", 2, "d1"); }),
              ErrorCode::ObjectNotFound);
}

TEST(MetadataIndexTest, LoadSnapshotRejectsMissingOrMalformed) {
    testutil::TempDir dir("index");
    InMemoryMetadataIndex index;
    index.insertIfAbsent(sampleMeta("keep"));
    EXPECT_FALSE(index.loadSnapshot((dir.path() / "absent.yaml").string()));

    const std::string bad = (dir.path() / "bad.yaml").string();
    std::ofstream(bad) << "chunks:\n  - digest: x\n    size: not-a-number\n";
    EXPECT_FALSE(index.loadSnapshot(bad));
    EXPECT_TRUE(index.lookup("keep").has_value());
}

TEST(MetadataIndexTest, AppendRequiresOpenManifest) {
    InMemoryMetadataIndex index;
    EXPECT_EQ(codeOf([&] { index.appendManifestEntry("obj", 1, "up", 0, "a"); }),
              ErrorCode::ObjectNotFound);
    EXPECT_EQ(codeOf([&] { index.getManifest("obj", 1); }), ErrorCode::ObjectNotFound);

    openManifest(index, "obj", 1);
    EXPECT_EQ(codeOf([&] { index.appendManifestEntry("obj", 1, "intruder", 0, "a"); }),
              ErrorCode::ObjectNotFound);
    EXPECT_EQ(index.appendManifestEntry("obj", 1, "up", 0, "a"), AppendOutcome::Appended);

    // A discarded manifest is not recreated by a late append.
    index.discardManifest("obj", 1);
    EXPECT_EQ(codeOf([&] { index.appendManifestEntry("obj", 1, "up", 1, "b"); }),
              ErrorCode::ObjectNotFound);
    EXPECT_EQ(codeOf([&] { index.getManifest("obj", 1); }), ErrorCode::ObjectNotFound);
}

TEST(MetadataIndexTest, OpenManifestReplacesStaleButNotCommitted) {
    InMemoryMetadataIndex index;
    openManifest(index, "obj", 1);
    index.appendManifestEntry("obj", 1, "up", 0, "a");

    index.openManifest("obj", 1, "next");
    EXPECT_TRUE(index.getManifest("obj", 1).entries.empty());
    EXPECT_EQ(codeOf([&] { index.appendManifestEntry("obj", 1, "up", 1, "b"); }),
              ErrorCode::ObjectNotFound);
    index.appendManifestEntry("obj", 1, "next", 0, "c");
    index.commitManifest("obj", 1, 1);

    EXPECT_EQ(codeOf([&] { index.openManifest("obj", 1, "late"); }), ErrorCode::ManifestCommitted);
    EXPECT_EQ(index.getManifest("obj", 1).digests(), (std::vector<std::string>{"c"}));
}

TEST(MetadataIndexTest, IsReferencedSeesOpenAndCommittedManifests) {
    InMemoryMetadataIndex index;
    EXPECT_FALSE(index.isReferenced("d1"));
    openManifest(index, "a", 1);
    index.appendManifestEntry("a", 1, "up", 0, "d1");
    EXPECT_TRUE(index.isReferenced("d1"));
    index.commitManifest("a", 1, 1);
    EXPECT_TRUE(index.isReferenced("d1"));
    EXPECT_FALSE(index.isReferenced("d2"));
}

TEST(MetadataIndexTest, LoadSnapshotRejectsUnusableShardCounts) {
    testutil::TempDir dir("index");
    InMemoryMetadataIndex index;
    index.insertIfAbsent(sampleMeta("keep"));

    const std::string noData = (dir.path() / "no-data.yaml").string();
    std::ofstream(noData) << "chunks:\n"
                             "  - digest: x\n"
                             "    size: 10\n"
                             "    compressed_size: 10\n"
                             "    data_shards: 0\n"
                             "    parity_shards: 0\n"
                             "    tier: hot\n"
                             "    created_at: 1700000000\n"
                             "    last_accessed_at: 1700000000\n"
                             "    shards: []\n"
                             "manifests: []\n";
    EXPECT_FALSE(index.loadSnapshot(noData));

    const std::string shortList = (dir.path() / "short.yaml").string();
    std::ofstream(shortList) << "chunks:\n"
                                "  - digest: x\n"
                                "    size: 10\n"
                                "    compressed_size: 10\n"
                                "    data_shards: 2\n"
                                "    parity_shards: 1\n"
                                "    tier: hot\n"
                                "    created_at: 1700000000\n"
                                "    last_accessed_at: 1700000000\n"
                                "    shards:\n"
                                "      - {index: 0, path: /d0/x, backend: d0}\n"
                                "manifests: []\n";
    EXPECT_FALSE(index.loadSnapshot(shortList));
    EXPECT_TRUE(index.lookup("keep").has_value());
    EXPECT_FALSE(index.lookup("x").has_value());
}
