#ifndef CHUNKVAULT_VAULT_ENGINE_HPP
#define CHUNKVAULT_VAULT_ENGINE_HPP

#include "cluster/BackendHealthCache.h"
#include "ingest/ingest_pipeline.hpp"
#include "ingest/upload_session.hpp"
#include "maintenance/ChunkGarbageCollector.h"
#include "maintenance/SessionReaper.h"
#include "maintenance/TieringSweeper.h"
#include "metadata/metadata_index.hpp"
#include "read/reconstruction_engine.hpp"
#include "storage/chunk_store.hpp"
#include "utilities/config.hpp"

#include <memory>
#include <string>

namespace chunkvault {

struct PutResult {
  UploadTicket ticket;
  FinalizeResult finalize;
  uint64_t chunksStored = 0; ///< Chunks that were not dedup hits
};

/**
 * @brief Wires every component together from an EngineConfig.
 *
 * One instance per process. Background workers only run between
 * startBackground() and stopBackground().
 */
class VaultEngine {
public:
  explicit VaultEngine(EngineConfig config);
  ~VaultEngine();

  VaultEngine(const VaultEngine &) = delete;
  VaultEngine &operator=(const VaultEngine &) = delete;

  const EngineConfig &config() const { return config_; }
  InMemoryMetadataIndex &index() { return index_; }
  const ChunkStore &store() const { return *store_; }
  UploadSessionManager &sessions() { return sessions_; }
  IngestPipeline &ingest() { return *pipeline_; }
  const ReconstructionEngine &reader() const { return *reader_; }
  BackendHealthCache &health() { return *health_; }
  TieringSweeper &tiering() { return *sweeper_; }
  ChunkGarbageCollector &garbageCollector() { return *gc_; }

  void startBackground();
  void stopBackground();

  /**
   * @brief Upload a local file as a new object version.
   *
   * The file is read twice: once for its checksum and size, once to admit
   * chunks of config().chunkSizeBytes.
   * @throws VaultException on any admission failure.
   */
  PutResult putFile(const std::string &path, const std::string &objectId,
                    uint64_t version = 0);

  /**
   * @brief Rewrite lost shards of one chunk.
   * @throws VaultException(ObjectNotFound) for an unknown digest.
   */
  size_t repairChunk(const std::string &digest);

private:
  EngineConfig config_;
  std::shared_ptr<BackendHealthCache> health_;
  std::unique_ptr<ChunkStore> store_;
  InMemoryMetadataIndex index_;
  UploadSessionManager sessions_;
  std::unique_ptr<IngestPipeline> pipeline_;
  std::unique_ptr<ReconstructionEngine> reader_;
  std::unique_ptr<TieringSweeper> sweeper_;
  std::unique_ptr<SessionReaper> reaper_;
  std::unique_ptr<ChunkGarbageCollector> gc_;
};

} // namespace chunkvault

#endif // CHUNKVAULT_VAULT_ENGINE_HPP
