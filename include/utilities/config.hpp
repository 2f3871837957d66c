#ifndef CHUNKVAULT_CONFIG_HPP
#define CHUNKVAULT_CONFIG_HPP

#include "utilities/logger.h"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace chunkvault {

/**
 * @brief Engine-wide settings.
 *
 * Defaults are usable for a single-host deployment; loadEngineConfig()
 * overlays a YAML file and then CHUNKVAULT_* environment variables.
 */
struct EngineConfig {
  std::vector<std::string> storageMounts; ///< One directory per device.
  size_t dataShards = 6;                  ///< k
  size_t parityShards = 3;                ///< m
  int compressionLevel = 3;
  size_t digestPrefixLength = 2; ///< Hex chars used for shard directories.
  std::chrono::seconds sessionTimeout{3600};
  std::chrono::seconds sessionRetention{600};
  uint64_t chunkSizeBytes = 8ull * 1024 * 1024;
  uint64_t maxObjectSizeBytes = 20ull * 1024 * 1024 * 1024;
  uint64_t maxChunksPerUpload = 1ull << 20; ///< Bounds per-session bitmaps.
  bool verifyOnDedup = false;
  std::chrono::seconds warmAfter{24 * 3600};
  std::chrono::seconds coldAfter{30 * 24 * 3600};
  std::chrono::seconds sweepInterval{300};
  LogLevel logLevel = LogLevel::INFO;

  /**
   * @brief Reject inconsistent settings.
   * @throws VaultException(InvalidConfig)
   */
  void validate() const;
};

/**
 * @brief Load configuration.
 *
 * @param path YAML file; when empty, $CHUNKVAULT_CONFIG or
 *        "chunkvault_config.yaml" is used. A missing default file is not an
 *        error, a malformed one is.
 * @throws VaultException(InvalidConfig) for unreadable values or a failed
 *         validate().
 */
EngineConfig loadEngineConfig(const std::string &path = "");

} // namespace chunkvault

#endif // CHUNKVAULT_CONFIG_HPP
