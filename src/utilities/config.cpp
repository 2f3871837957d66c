#include "utilities/config.hpp"
#include "utilities/errors.hpp"
#include "utilities/var_dir.hpp"

#include <cstdlib>
#include <filesystem>
#include <yaml-cpp/yaml.h>

namespace chunkvault {

namespace {

void applyYaml(EngineConfig &cfg, const YAML::Node &node) {
  if (node["storage_mounts"]) {
    cfg.storageMounts = node["storage_mounts"].as<std::vector<std::string>>();
  }
  if (node["data_shards"])
    cfg.dataShards = node["data_shards"].as<size_t>();
  if (node["parity_shards"])
    cfg.parityShards = node["parity_shards"].as<size_t>();
  if (node["compression_level"])
    cfg.compressionLevel = node["compression_level"].as<int>();
  if (node["digest_prefix_length"])
    cfg.digestPrefixLength = node["digest_prefix_length"].as<size_t>();
  if (node["session_timeout_seconds"])
    cfg.sessionTimeout =
        std::chrono::seconds(node["session_timeout_seconds"].as<long>());
  if (node["session_retention_seconds"])
    cfg.sessionRetention =
        std::chrono::seconds(node["session_retention_seconds"].as<long>());
  if (node["chunk_size_bytes"])
    cfg.chunkSizeBytes = node["chunk_size_bytes"].as<uint64_t>();
  if (node["max_object_size_bytes"])
    cfg.maxObjectSizeBytes = node["max_object_size_bytes"].as<uint64_t>();
  if (node["max_chunks_per_upload"])
    cfg.maxChunksPerUpload = node["max_chunks_per_upload"].as<uint64_t>();
  if (node["verify_on_dedup"])
    cfg.verifyOnDedup = node["verify_on_dedup"].as<bool>();
  if (node["warm_after_seconds"])
    cfg.warmAfter = std::chrono::seconds(node["warm_after_seconds"].as<long>());
  if (node["cold_after_seconds"])
    cfg.coldAfter = std::chrono::seconds(node["cold_after_seconds"].as<long>());
  if (node["sweep_interval_seconds"])
    cfg.sweepInterval =
        std::chrono::seconds(node["sweep_interval_seconds"].as<long>());
  if (node["log_level"])
    cfg.logLevel = parseLogLevel(node["log_level"].as<std::string>());
}

size_t envSize(const char *name, const char *value) {
  try {
    return static_cast<size_t>(std::stoul(value));
  } catch (const std::exception &) {
    throw VaultException(ErrorCode::InvalidConfig,
                         std::string(name) + " is not a number: " + value);
  }
}

void applyEnvironment(EngineConfig &cfg) {
  if (const char *env = std::getenv("CHUNKVAULT_COMPRESSION_LEVEL"))
    cfg.compressionLevel =
        static_cast<int>(envSize("CHUNKVAULT_COMPRESSION_LEVEL", env));
  if (const char *env = std::getenv("CHUNKVAULT_DATA_SHARDS"))
    cfg.dataShards = envSize("CHUNKVAULT_DATA_SHARDS", env);
  if (const char *env = std::getenv("CHUNKVAULT_PARITY_SHARDS"))
    cfg.parityShards = envSize("CHUNKVAULT_PARITY_SHARDS", env);
}

} // namespace

void EngineConfig::validate() const {
  if (dataShards == 0) {
    throw VaultException(ErrorCode::InvalidConfig,
                         "data_shards must be at least 1");
  }
  if (dataShards + parityShards > 256) {
    throw VaultException(ErrorCode::InvalidConfig,
                         "data_shards + parity_shards must not exceed 256");
  }
  if (storageMounts.empty()) {
    throw VaultException(ErrorCode::InvalidConfig,
                         "at least one storage mount is required");
  }
  if (digestPrefixLength == 0 || digestPrefixLength > 8) {
    throw VaultException(ErrorCode::InvalidConfig,
                         "digest_prefix_length must be between 1 and 8");
  }
  if (chunkSizeBytes == 0) {
    throw VaultException(ErrorCode::InvalidConfig,
                         "chunk_size_bytes must be positive");
  }
  if (maxChunksPerUpload == 0) {
    throw VaultException(ErrorCode::InvalidConfig,
                         "max_chunks_per_upload must be positive");
  }
  if (coldAfter < warmAfter) {
    throw VaultException(ErrorCode::InvalidConfig,
                         "cold_after_seconds must not be below "
                         "warm_after_seconds");
  }
}

EngineConfig loadEngineConfig(const std::string &path) {
  EngineConfig cfg;
  std::string file = path;
  bool explicitFile = !file.empty();
  if (!explicitFile) {
    const char *env = std::getenv("CHUNKVAULT_CONFIG");
    explicitFile = env != nullptr;
    file = env ? env : "chunkvault_config.yaml";
  }

  if (explicitFile || std::filesystem::exists(file)) {
    try {
      applyYaml(cfg, YAML::LoadFile(file));
    } catch (const YAML::Exception &e) {
      throw VaultException(ErrorCode::InvalidConfig,
                           "Failed to load " + file + ": " + e.what());
    }
  }
  applyEnvironment(cfg);

  if (cfg.storageMounts.empty()) {
    cfg.storageMounts.push_back(defaultStorageRoot());
  }
  cfg.validate();
  return cfg;
}

} // namespace chunkvault
