#include "metadata/metadata_index.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <functional>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace chunkvault {

namespace {

int64_t toEpochSeconds(SystemClock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::seconds>(
             tp.time_since_epoch())
      .count();
}

SystemClock::time_point fromEpochSeconds(int64_t secs) {
  return SystemClock::time_point(std::chrono::seconds(secs));
}

std::string manifestName(const std::string &objectId, uint64_t version) {
  return objectId + "@v" + std::to_string(version);
}

// A row the chunk store could not decode must not enter the index.
void validateChunkRow(const ChunkMeta &meta) {
  const size_t total = meta.dataShards + meta.parityShards;
  if (meta.dataShards == 0 || total > 256) {
    throw std::invalid_argument("chunk " + meta.digest +
                                " has invalid shard counts " +
                                std::to_string(meta.dataShards) + "+" +
                                std::to_string(meta.parityShards));
  }
  if (meta.shardLocations.size() != total) {
    throw std::invalid_argument(
        "chunk " + meta.digest + " lists " +
        std::to_string(meta.shardLocations.size()) + " shards, expected " +
        std::to_string(total));
  }
  for (const auto &loc : meta.shardLocations) {
    if (loc.shardIndex >= total) {
      throw std::invalid_argument("chunk " + meta.digest + " has shard index " +
                                  std::to_string(loc.shardIndex));
    }
  }
}

} // namespace

InMemoryMetadataIndex::ChunkStripe &
InMemoryMetadataIndex::stripeFor(const std::string &digest) const {
  return stripes_[std::hash<std::string>{}(digest) % kStripeCount];
}

std::optional<ChunkMeta>
InMemoryMetadataIndex::lookup(const std::string &digest) const {
  auto &stripe = stripeFor(digest);
  std::lock_guard<std::mutex> lock(stripe.mutex);
  auto it = stripe.rows.find(digest);
  if (it == stripe.rows.end())
    return std::nullopt;
  return it->second;
}

InsertOutcome InMemoryMetadataIndex::insertIfAbsent(const ChunkMeta &meta) {
  auto &stripe = stripeFor(meta.digest);
  std::lock_guard<std::mutex> lock(stripe.mutex);
  auto [it, inserted] = stripe.rows.emplace(meta.digest, meta);
  (void)it;
  return inserted ? InsertOutcome::Inserted : InsertOutcome::AlreadyExists;
}

bool InMemoryMetadataIndex::updateTier(const std::string &digest,
                                       StorageTier tier) {
  auto &stripe = stripeFor(digest);
  std::lock_guard<std::mutex> lock(stripe.mutex);
  auto it = stripe.rows.find(digest);
  if (it == stripe.rows.end())
    return false;
  it->second.tier = tier;
  return true;
}

bool InMemoryMetadataIndex::touch(const std::string &digest,
                                  SystemClock::time_point when) {
  auto &stripe = stripeFor(digest);
  std::lock_guard<std::mutex> lock(stripe.mutex);
  auto it = stripe.rows.find(digest);
  if (it == stripe.rows.end())
    return false;
  if (when > it->second.lastAccessedAt)
    it->second.lastAccessedAt = when;
  return true;
}

bool InMemoryMetadataIndex::removeChunk(const std::string &digest) {
  auto &stripe = stripeFor(digest);
  std::lock_guard<std::mutex> lock(stripe.mutex);
  return stripe.rows.erase(digest) > 0;
}

std::vector<ChunkMeta> InMemoryMetadataIndex::listChunks() const {
  std::vector<ChunkMeta> out;
  for (auto &stripe : stripes_) {
    std::lock_guard<std::mutex> lock(stripe.mutex);
    for (const auto &[digest, meta] : stripe.rows)
      out.push_back(meta);
  }
  return out;
}

size_t InMemoryMetadataIndex::chunkCount() const {
  size_t total = 0;
  for (auto &stripe : stripes_) {
    std::lock_guard<std::mutex> lock(stripe.mutex);
    total += stripe.rows.size();
  }
  return total;
}

std::shared_ptr<InMemoryMetadataIndex::ManifestRecord>
InMemoryMetadataIndex::findManifest(const std::string &objectId,
                                    uint64_t version) const {
  std::shared_lock<std::shared_mutex> lock(manifestsMutex_);
  auto it = manifests_.find({objectId, version});
  return it == manifests_.end() ? nullptr : it->second;
}

void InMemoryMetadataIndex::openManifest(const std::string &objectId,
                                         uint64_t version,
                                         const std::string &uploadId) {
  auto record = std::make_shared<ManifestRecord>();
  record->uploadId = uploadId;

  std::unique_lock<std::shared_mutex> lock(manifestsMutex_);
  auto &slot = manifests_[{objectId, version}];
  if (slot) {
    std::lock_guard<std::mutex> recordLock(slot->mutex);
    if (slot->state == ManifestState::Committed) {
      ThrowVaultException(ErrorCode::ManifestCommitted,
                          manifestName(objectId, version) +
                              " is committed and cannot be reopened");
    }
    Logger::getInstance().log(LogLevel::INFO,
                              "Replacing stale manifest " +
                                  manifestName(objectId, version) +
                                  " for upload " + uploadId);
  }
  slot = std::move(record);
}

AppendOutcome InMemoryMetadataIndex::appendManifestEntry(
    const std::string &objectId, uint64_t version, const std::string &uploadId,
    uint64_t chunkIndex, const std::string &digest) {
  auto record = findManifest(objectId, version);
  if (!record) {
    ThrowVaultException(ErrorCode::ObjectNotFound,
                        "No open manifest " + manifestName(objectId, version));
  }
  std::lock_guard<std::mutex> lock(record->mutex);
  if (record->uploadId != uploadId) {
    ThrowVaultException(ErrorCode::ObjectNotFound,
                        manifestName(objectId, version) +
                            " is not open for upload " + uploadId);
  }
  if (record->state == ManifestState::Committed) {
    ThrowVaultException(ErrorCode::ManifestCommitted,
                        manifestName(objectId, version) +
                            " is committed and cannot change");
  }
  if (record->state == ManifestState::Invalid) {
    Logger::getInstance().log(LogLevel::INFO,
                              "Reopening invalidated manifest " +
                                  manifestName(objectId, version));
    record->entries.clear();
    record->state = ManifestState::Open;
  }
  auto it = record->entries.find(chunkIndex);
  if (it != record->entries.end()) {
    if (it->second == digest)
      return AppendOutcome::AlreadyPresent;
    ThrowVaultException(ErrorCode::DuplicateChunkIndex,
                        manifestName(objectId, version) + " chunk " +
                            std::to_string(chunkIndex) +
                            " already recorded as " + it->second);
  }
  record->entries.emplace(chunkIndex, digest);
  return AppendOutcome::Appended;
}

std::optional<std::string>
InMemoryMetadataIndex::manifestEntry(const std::string &objectId,
                                     uint64_t version,
                                     uint64_t chunkIndex) const {
  auto record = findManifest(objectId, version);
  if (!record)
    return std::nullopt;
  std::lock_guard<std::mutex> lock(record->mutex);
  if (record->state == ManifestState::Invalid)
    return std::nullopt;
  auto it = record->entries.find(chunkIndex);
  if (it == record->entries.end())
    return std::nullopt;
  return it->second;
}

ObjectManifest InMemoryMetadataIndex::getManifest(const std::string &objectId,
                                                  uint64_t version) const {
  auto record = findManifest(objectId, version);
  if (!record) {
    throw VaultException(ErrorCode::ObjectNotFound,
                         "No manifest for " + manifestName(objectId, version));
  }
  ObjectManifest manifest;
  manifest.objectId = objectId;
  manifest.version = version;
  std::lock_guard<std::mutex> lock(record->mutex);
  manifest.state = record->state;
  manifest.entries.reserve(record->entries.size());
  for (const auto &[index, digest] : record->entries)
    manifest.entries.push_back(ManifestEntry{index, digest});
  return manifest;
}

void InMemoryMetadataIndex::commitManifest(const std::string &objectId,
                                           uint64_t version,
                                           uint64_t totalChunks) {
  auto record = findManifest(objectId, version);
  if (!record) {
    ThrowVaultException(ErrorCode::ObjectNotFound,
                        "Cannot commit missing manifest " +
                            manifestName(objectId, version));
  }
  std::lock_guard<std::mutex> lock(record->mutex);
  const bool contiguous =
      record->entries.size() == totalChunks &&
      (totalChunks == 0 || record->entries.rbegin()->first == totalChunks - 1);
  if (record->state == ManifestState::Committed) {
    if (contiguous)
      return;
    ThrowVaultException(ErrorCode::ManifestCommitted,
                        manifestName(objectId, version) +
                            " is already committed with " +
                            std::to_string(record->entries.size()) +
                            " chunks");
  }
  if (record->state == ManifestState::Invalid || !contiguous) {
    ThrowVaultException(ErrorCode::IncompleteUpload,
                        manifestName(objectId, version) + " has " +
                            std::to_string(record->entries.size()) + " of " +
                            std::to_string(totalChunks) + " chunks");
  }
  record->state = ManifestState::Committed;
}

void InMemoryMetadataIndex::invalidateManifest(const std::string &objectId,
                                               uint64_t version) {
  auto record = findManifest(objectId, version);
  if (!record)
    return;
  std::lock_guard<std::mutex> lock(record->mutex);
  if (record->state != ManifestState::Committed)
    record->state = ManifestState::Invalid;
}

void InMemoryMetadataIndex::discardManifest(const std::string &objectId,
                                            uint64_t version) {
  std::unique_lock<std::shared_mutex> lock(manifestsMutex_);
  auto it = manifests_.find({objectId, version});
  if (it == manifests_.end())
    return;
  auto record = it->second;
  std::lock_guard<std::mutex> recordLock(record->mutex);
  if (record->state == ManifestState::Committed)
    return;
  manifests_.erase(it);
}

std::optional<uint64_t>
InMemoryMetadataIndex::latestCommittedVersion(
    const std::string &objectId) const {
  std::shared_lock<std::shared_mutex> lock(manifestsMutex_);
  std::optional<uint64_t> latest;
  auto it = manifests_.lower_bound({objectId, 0});
  for (; it != manifests_.end() && it->first.first == objectId; ++it) {
    std::lock_guard<std::mutex> recordLock(it->second->mutex);
    if (it->second->state == ManifestState::Committed)
      latest = it->first.second;
  }
  return latest;
}

std::unordered_set<std::string>
InMemoryMetadataIndex::referencedDigests() const {
  std::unordered_set<std::string> out;
  std::shared_lock<std::shared_mutex> lock(manifestsMutex_);
  for (const auto &[key, record] : manifests_) {
    std::lock_guard<std::mutex> recordLock(record->mutex);
    for (const auto &[index, digest] : record->entries)
      out.insert(digest);
  }
  return out;
}

bool InMemoryMetadataIndex::isReferenced(const std::string &digest) const {
  std::shared_lock<std::shared_mutex> lock(manifestsMutex_);
  for (const auto &[key, record] : manifests_) {
    std::lock_guard<std::mutex> recordLock(record->mutex);
    for (const auto &[index, entry] : record->entries) {
      if (entry == digest)
        return true;
    }
  }
  return false;
}

bool InMemoryMetadataIndex::saveSnapshot(const std::string &path) const {
  YAML::Emitter out;
  out << YAML::BeginMap;

  out << YAML::Key << "chunks" << YAML::Value << YAML::BeginSeq;
  for (const auto &meta : listChunks()) {
    out << YAML::BeginMap;
    out << YAML::Key << "digest" << YAML::Value << meta.digest;
    out << YAML::Key << "size" << YAML::Value << meta.sizeBytes;
    out << YAML::Key << "compressed_size" << YAML::Value
        << meta.compressedSizeBytes;
    out << YAML::Key << "data_shards" << YAML::Value << meta.dataShards;
    out << YAML::Key << "parity_shards" << YAML::Value << meta.parityShards;
    out << YAML::Key << "tier" << YAML::Value << tierName(meta.tier);
    out << YAML::Key << "created_at" << YAML::Value
        << toEpochSeconds(meta.createdAt);
    out << YAML::Key << "last_accessed_at" << YAML::Value
        << toEpochSeconds(meta.lastAccessedAt);
    out << YAML::Key << "shards" << YAML::Value << YAML::BeginSeq;
    for (const auto &loc : meta.shardLocations) {
      out << YAML::Flow << YAML::BeginMap;
      out << YAML::Key << "index" << YAML::Value << loc.shardIndex;
      out << YAML::Key << "backend" << YAML::Value << loc.backendId;
      out << YAML::Key << "path" << YAML::Value << loc.storagePath;
      if (!loc.checksum.empty())
        out << YAML::Key << "checksum" << YAML::Value << loc.checksum;
      out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;
  }
  out << YAML::EndSeq;

  out << YAML::Key << "manifests" << YAML::Value << YAML::BeginSeq;
  {
    std::shared_lock<std::shared_mutex> lock(manifestsMutex_);
    for (const auto &[key, record] : manifests_) {
      std::lock_guard<std::mutex> recordLock(record->mutex);
      out << YAML::BeginMap;
      out << YAML::Key << "object_id" << YAML::Value << key.first;
      out << YAML::Key << "version" << YAML::Value << key.second;
      out << YAML::Key << "state" << YAML::Value
          << manifestStateName(record->state);
      if (!record->uploadId.empty())
        out << YAML::Key << "upload_id" << YAML::Value << record->uploadId;
      out << YAML::Key << "entries" << YAML::Value << YAML::BeginSeq;
      for (const auto &[index, digest] : record->entries) {
        out << YAML::Flow << YAML::BeginSeq << index << digest
            << YAML::EndSeq;
      }
      out << YAML::EndSeq;
      out << YAML::EndMap;
    }
  }
  out << YAML::EndSeq;
  out << YAML::EndMap;

  std::error_code ec;
  auto parent = std::filesystem::path(path).parent_path();
  if (!parent.empty())
    std::filesystem::create_directories(parent, ec);

  const std::string tmp = path + ".tmp";
  {
    std::ofstream file(tmp, std::ios::trunc);
    if (!file) {
      Logger::getInstance().log(LogLevel::ERROR,
                                "Cannot write index snapshot " + tmp);
      return false;
    }
    file << out.c_str() << "\n";
    if (!file.good()) {
      Logger::getInstance().log(LogLevel::ERROR,
                                "Short write on index snapshot " + tmp);
      return false;
    }
  }
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    Logger::getInstance().log(LogLevel::ERROR, "Cannot rename snapshot to " +
                                                   path + ": " + ec.message());
    return false;
  }
  return true;
}

bool InMemoryMetadataIndex::loadSnapshot(const std::string &path) {
  if (!std::filesystem::exists(path))
    return false;

  std::vector<ChunkMeta> chunks;
  std::map<ManifestKey, std::shared_ptr<ManifestRecord>> manifests;
  try {
    YAML::Node root = YAML::LoadFile(path);
    for (const auto &node : root["chunks"]) {
      ChunkMeta meta;
      meta.digest = node["digest"].as<std::string>();
      meta.sizeBytes = node["size"].as<uint64_t>();
      meta.compressedSizeBytes = node["compressed_size"].as<uint64_t>();
      meta.dataShards = node["data_shards"].as<size_t>();
      meta.parityShards = node["parity_shards"].as<size_t>();
      meta.tier = parseTier(node["tier"].as<std::string>());
      meta.createdAt = fromEpochSeconds(node["created_at"].as<int64_t>());
      meta.lastAccessedAt =
          fromEpochSeconds(node["last_accessed_at"].as<int64_t>());
      for (const auto &shard : node["shards"]) {
        meta.shardLocations.push_back(ShardLocation{
            shard["index"].as<size_t>(), shard["path"].as<std::string>(),
            shard["backend"].as<std::string>(),
            shard["checksum"] ? shard["checksum"].as<std::string>() : ""});
      }
      validateChunkRow(meta);
      chunks.push_back(std::move(meta));
    }
    for (const auto &node : root["manifests"]) {
      auto record = std::make_shared<ManifestRecord>();
      record->state = parseManifestState(node["state"].as<std::string>());
      if (node["upload_id"])
        record->uploadId = node["upload_id"].as<std::string>();
      for (const auto &entry : node["entries"]) {
        record->entries.emplace(entry[0].as<uint64_t>(),
                                entry[1].as<std::string>());
      }
      manifests.emplace(ManifestKey{node["object_id"].as<std::string>(),
                                    node["version"].as<uint64_t>()},
                        std::move(record));
    }
  } catch (const YAML::Exception &e) {
    Logger::getInstance().log(LogLevel::ERROR, "Malformed index snapshot " +
                                                   path + ": " + e.what());
    return false;
  } catch (const std::invalid_argument &e) {
    Logger::getInstance().log(LogLevel::ERROR, "Malformed index snapshot " +
                                                   path + ": " + e.what());
    return false;
  }

  for (auto &stripe : stripes_) {
    std::lock_guard<std::mutex> lock(stripe.mutex);
    stripe.rows.clear();
  }
  for (auto &meta : chunks) {
    auto &stripe = stripeFor(meta.digest);
    std::lock_guard<std::mutex> lock(stripe.mutex);
    stripe.rows[meta.digest] = std::move(meta);
  }
  {
    std::unique_lock<std::shared_mutex> lock(manifestsMutex_);
    manifests_ = std::move(manifests);
  }
  Logger::getInstance().log(LogLevel::INFO,
                            "Loaded index snapshot " + path + " (" +
                                std::to_string(chunkCount()) + " chunks)");
  return true;
}

} // namespace chunkvault
