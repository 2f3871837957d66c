#include "gtest/gtest.h"
#include "test_helpers.hpp"
#include "utilities/config.hpp"
#include "utilities/errors.hpp"
#include "utilities/var_dir.hpp"
#include <cstdlib>
#include <fstream>

using namespace chunkvault;

namespace {

class ConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        unsetenv("CHUNKVAULT_COMPRESSION_LEVEL");
        unsetenv("CHUNKVAULT_DATA_SHARDS");
        unsetenv("CHUNKVAULT_PARITY_SHARDS");
    }

    std::string writeConfig(const std::string& body) {
        std::string path = (dir_.path() / "chunkvault_config.yaml").string();
        std::ofstream(path) << body;
        return path;
    }

    ErrorCode loadCode(const std::string& path) {
        try {
            loadEngineConfig(path);
        } catch (const VaultException& e) {
            return e.code();
        }
        return ErrorCode::None;
    }

    testutil::TempDir dir_{"config"};
};

EngineConfig validConfig() {
    EngineConfig cfg;
    cfg.storageMounts = {"/tmp/a"};
    return cfg;
}

} // namespace

TEST_F(ConfigTest, LoadsYamlValues) {
    std::string path = writeConfig(
        "storage_mounts: [/data/d0, /data/d1, /data/d2]\n"
        "data_shards: 4\n"
        "parity_shards: 2\n"
        "compression_level: 9\n"
        "digest_prefix_length: 3\n"
        "chunk_size_bytes: 1048576\n"
        "max_chunks_per_upload: 4096\n"
        "session_timeout_seconds: 120\n"
        "verify_on_dedup: true\n"
        "warm_after_seconds: 60\n"
        "cold_after_seconds: 600\n"
        "log_level: debug\n");
    EngineConfig cfg = loadEngineConfig(path);
    EXPECT_EQ(cfg.storageMounts.size(), 3u);
    EXPECT_EQ(cfg.storageMounts[2], "/data/d2");
    EXPECT_EQ(cfg.dataShards, 4u);
    EXPECT_EQ(cfg.parityShards, 2u);
    EXPECT_EQ(cfg.compressionLevel, 9);
    EXPECT_EQ(cfg.digestPrefixLength, 3u);
    EXPECT_EQ(cfg.chunkSizeBytes, 1048576u);
    EXPECT_EQ(cfg.maxChunksPerUpload, 4096u);
    EXPECT_EQ(cfg.sessionTimeout, std::chrono::seconds(120));
    EXPECT_TRUE(cfg.verifyOnDedup);
    EXPECT_EQ(cfg.warmAfter, std::chrono::seconds(60));
    EXPECT_EQ(cfg.coldAfter, std::chrono::seconds(600));
    EXPECT_EQ(cfg.logLevel, LogLevel::DEBUG);
    // Untouched keys keep their defaults.
    EXPECT_EQ(cfg.sessionRetention, std::chrono::seconds(600));
}

TEST_F(ConfigTest, EmptyFileUsesDefaultsAndDefaultMount) {
    EngineConfig cfg = loadEngineConfig(writeConfig("{}\n"));
    EXPECT_EQ(cfg.dataShards, 6u);
    EXPECT_EQ(cfg.parityShards, 3u);
    EXPECT_EQ(cfg.chunkSizeBytes, 8ull * 1024 * 1024);
    ASSERT_EQ(cfg.storageMounts.size(), 1u);
    EXPECT_EQ(cfg.storageMounts[0], defaultStorageRoot());
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
    std::string path = writeConfig("data_shards: 4\nparity_shards: 2\n");
    setenv("CHUNKVAULT_DATA_SHARDS", "10", 1);
    setenv("CHUNKVAULT_PARITY_SHARDS", "4", 1);
    setenv("CHUNKVAULT_COMPRESSION_LEVEL", "1", 1);
    EngineConfig cfg = loadEngineConfig(path);
    EXPECT_EQ(cfg.dataShards, 10u);
    EXPECT_EQ(cfg.parityShards, 4u);
    EXPECT_EQ(cfg.compressionLevel, 1);

    setenv("CHUNKVAULT_DATA_SHARDS", "many", 1);
    EXPECT_EQ(loadCode(path), ErrorCode::InvalidConfig);
}

TEST_F(ConfigTest, MalformedOrMissingExplicitFile) {
    EXPECT_EQ(loadCode(writeConfig("data_shards: [1, 2\n")), ErrorCode::InvalidConfig);
    EXPECT_EQ(loadCode(writeConfig("data_shards: lots\n")), ErrorCode::InvalidConfig);
    EXPECT_EQ(loadCode(writeConfig("log_level: chatty\n")), ErrorCode::InvalidConfig);
    EXPECT_EQ(loadCode((dir_.path() / "absent.yaml").string()), ErrorCode::InvalidConfig);
}

TEST_F(ConfigTest, LoadRejectsInvalidShardCounts) {
    EXPECT_EQ(loadCode(writeConfig("data_shards: 0\n")), ErrorCode::InvalidConfig);
    EXPECT_EQ(loadCode(writeConfig("data_shards: 200\nparity_shards: 57\n")),
              ErrorCode::InvalidConfig);
    EXPECT_EQ(loadCode(writeConfig("max_chunks_per_upload: 0\n")), ErrorCode::InvalidConfig);
}

TEST(EngineConfigTest, ValidateChecksEachRule) {
    EXPECT_NO_THROW(validConfig().validate());

    EngineConfig cfg = validConfig();
    cfg.storageMounts.clear();
    EXPECT_THROW(cfg.validate(), VaultException);

    cfg = validConfig();
    cfg.digestPrefixLength = 0;
    EXPECT_THROW(cfg.validate(), VaultException);
    cfg.digestPrefixLength = 9;
    EXPECT_THROW(cfg.validate(), VaultException);

    cfg = validConfig();
    cfg.chunkSizeBytes = 0;
    EXPECT_THROW(cfg.validate(), VaultException);

    cfg = validConfig();
    cfg.warmAfter = std::chrono::seconds(100);
    cfg.coldAfter = std::chrono::seconds(50);
    EXPECT_THROW(cfg.validate(), VaultException);

    cfg = validConfig();
    cfg.dataShards = 200;
    cfg.parityShards = 56;
    EXPECT_NO_THROW(cfg.validate());
}
