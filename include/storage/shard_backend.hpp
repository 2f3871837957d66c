#ifndef CHUNKVAULT_SHARD_BACKEND_HPP
#define CHUNKVAULT_SHARD_BACKEND_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace chunkvault {

/**
 * @brief One physical device or mount point that stores shard files.
 */
class ShardBackend {
public:
  virtual ~ShardBackend() = default;

  /** Stable identifier, used for placement and health tracking. */
  virtual const std::string &id() const = 0;

  /**
   * @brief Durably store @p data under @p relativePath.
   *
   * Returns only after the bytes are on stable storage.
   * @return The storage path to record in the metadata index.
   * @throws VaultException(StorageWriteFailure)
   */
  virtual std::string write(const std::string &relativePath,
                            const std::vector<std::byte> &data) = 0;

  /**
   * @brief Read a shard previously returned by write().
   * @return std::nullopt when the shard no longer exists.
   * @throws VaultException(StorageReadFailure) on I/O errors.
   */
  virtual std::optional<std::vector<std::byte>>
  read(const std::string &storagePath) const = 0;

  /** Delete a shard. Returns false if it did not exist. */
  virtual bool remove(const std::string &storagePath) = 0;
};

/**
 * @brief ShardBackend on a local directory.
 *
 * Writes go to a temporary file that is fsync'ed and renamed into place, so
 * a crash never leaves a torn shard under the final name. Rewriting an
 * existing shard with identical content is harmless.
 */
class LocalShardBackend : public ShardBackend {
public:
  explicit LocalShardBackend(std::string root);

  const std::string &id() const override { return root_; }
  std::string write(const std::string &relativePath,
                    const std::vector<std::byte> &data) override;
  std::optional<std::vector<std::byte>>
  read(const std::string &storagePath) const override;
  bool remove(const std::string &storagePath) override;

private:
  std::string root_;
};

} // namespace chunkvault

#endif // CHUNKVAULT_SHARD_BACKEND_HPP
