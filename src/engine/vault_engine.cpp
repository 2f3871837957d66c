#include "engine/vault_engine.hpp"
#include "storage/shard_backend.hpp"
#include "utilities/chunk_hasher.hpp"
#include "utilities/logger.h"

#include <fstream>

namespace chunkvault {

namespace {

std::vector<std::shared_ptr<ShardBackend>>
makeBackends(const std::vector<std::string> &mounts) {
  std::vector<std::shared_ptr<ShardBackend>> backends;
  backends.reserve(mounts.size());
  for (const auto &mount : mounts)
    backends.push_back(std::make_shared<LocalShardBackend>(mount));
  return backends;
}

bool readBlock(std::ifstream &in, std::vector<std::byte> &buf, size_t size) {
  buf.resize(size);
  in.read(reinterpret_cast<char *>(buf.data()),
          static_cast<std::streamsize>(size));
  buf.resize(static_cast<size_t>(in.gcount()));
  return !buf.empty();
}

} // namespace

VaultEngine::VaultEngine(EngineConfig config)
    : config_(std::move(config)),
      health_(std::make_shared<BackendHealthCache>()),
      sessions_(config_.sessionTimeout, config_.sessionRetention) {
  config_.validate();
  auto coder = std::make_shared<ReedSolomonCoder>(config_.dataShards,
                                                  config_.parityShards);
  store_ = std::make_unique<ChunkStore>(
      makeBackends(config_.storageMounts), coder,
      Compressor(config_.compressionLevel), config_.digestPrefixLength,
      health_);

  IngestOptions options;
  options.verifyOnDedup = config_.verifyOnDedup;
  options.maxObjectSizeBytes = config_.maxObjectSizeBytes;
  options.maxChunksPerUpload = config_.maxChunksPerUpload;
  pipeline_ =
      std::make_unique<IngestPipeline>(index_, *store_, sessions_, options);
  reader_ = std::make_unique<ReconstructionEngine>(index_, *store_);
  sweeper_ = std::make_unique<TieringSweeper>(
      index_, config_.warmAfter, config_.coldAfter, config_.sweepInterval);
  reaper_ = std::make_unique<SessionReaper>(*pipeline_, config_.sweepInterval);
  gc_ = std::make_unique<ChunkGarbageCollector>(
      index_, *store_, config_.sessionTimeout, pipeline_->claims());

  Logger::getInstance().log(
      LogLevel::INFO,
      "ChunkVault engine ready: " + std::to_string(config_.dataShards) + "+" +
          std::to_string(config_.parityShards) + " shards over " +
          std::to_string(config_.storageMounts.size()) + " mounts");
}

VaultEngine::~VaultEngine() { stopBackground(); }

void VaultEngine::startBackground() {
  sweeper_->start();
  reaper_->start();
}

void VaultEngine::stopBackground() {
  if (sweeper_)
    sweeper_->stop();
  if (reaper_)
    reaper_->stop();
}

PutResult VaultEngine::putFile(const std::string &path,
                               const std::string &objectId, uint64_t version) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    ThrowVaultException(ErrorCode::StorageReadFailure,
                        "Cannot open input file " + path);
  }

  ChunkHasher whole;
  uint64_t totalSize = 0;
  std::vector<std::byte> block;
  while (readBlock(in, block, static_cast<size_t>(config_.chunkSizeBytes))) {
    whole.update(block);
    totalSize += block.size();
  }
  if (totalSize == 0) {
    ThrowVaultException(ErrorCode::EmptyChunk,
                        path + " is empty; empty objects are not stored");
  }

  UploadRequest request;
  request.objectId = objectId;
  request.version = version;
  request.totalChunks =
      IngestPipeline::planChunks(totalSize, config_.chunkSizeBytes);
  request.originalChecksum = whole.finalizeHex();
  request.totalSizeBytes = totalSize;

  PutResult result;
  result.ticket = pipeline_->createUpload(request);

  in.clear();
  in.seekg(0);
  uint64_t index = 0;
  while (readBlock(in, block, static_cast<size_t>(config_.chunkSizeBytes))) {
    ChunkUpload upload;
    upload.uploadId = result.ticket.uploadId;
    upload.chunkIndex = index++;
    upload.totalChunks = result.ticket.totalChunks;
    upload.rawBytes = block;
    AdmitResult admitted = pipeline_->admit(upload);
    if (admitted.status == AdmitStatus::Error) {
      pipeline_->cancel(result.ticket.uploadId);
      ThrowVaultException(admitted.error, "Upload of " + path +
                                              " failed at chunk " +
                                              std::to_string(upload.chunkIndex) +
                                              ": " + admitted.message);
    }
    if (!admitted.dedupHit)
      ++result.chunksStored;
  }

  FinalizeRequest finalize;
  finalize.uploadId = result.ticket.uploadId;
  result.finalize = pipeline_->finalize(finalize);
  return result;
}

size_t VaultEngine::repairChunk(const std::string &digest) {
  auto meta = index_.lookup(digest);
  if (!meta) {
    ThrowVaultException(ErrorCode::ObjectNotFound, "Unknown chunk " + digest);
  }
  return store_->repairChunk(*meta);
}

} // namespace chunkvault
