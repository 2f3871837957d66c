#ifndef CHUNKVAULT_ERASURE_CODER_HPP
#define CHUNKVAULT_ERASURE_CODER_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <set>
#include <vector>

namespace chunkvault {

using Shard = std::vector<std::byte>;
/// Shards keyed by shard index, as handed to decode().
using ShardMap = std::map<size_t, Shard>;

/**
 * @brief Interface for k+m erasure codes applied to one compressed chunk.
 *
 * Shards 0..k-1 carry data, k..k+m-1 carry parity. Implementations must be
 * systematic and MDS: any k distinct shards recover the payload.
 */
class ErasureCoder {
public:
  virtual ~ErasureCoder() = default;

  virtual size_t dataShards() const = 0;
  virtual size_t parityShards() const = 0;
  size_t totalShards() const { return dataShards() + parityShards(); }

  /** Size of each shard produced for a payload of @p payloadSize bytes. */
  virtual size_t shardSize(size_t payloadSize) const = 0;

  /** Split @p payload into totalShards() equally sized shards. */
  virtual std::vector<Shard> encode(const std::vector<std::byte> &payload) const = 0;

  /**
   * @brief Rebuild the payload from the shards in @p available.
   *
   * Shards whose size differs from shardSize(payloadSize) are ignored.
   * @throws VaultException(InsufficientShards) when fewer than k usable
   *         shards remain.
   */
  virtual std::vector<std::byte> decode(const ShardMap &available,
                                        size_t payloadSize) const = 0;

  /**
   * @brief Rebuild the complete shard set, e.g. to repair lost shards.
   * @throws VaultException(InsufficientShards)
   */
  virtual std::vector<Shard> reconstructAll(const ShardMap &available,
                                            size_t payloadSize) const;

  /**
   * @brief Choose the shards to read from @p available.
   *
   * Data shards are preferred since they avoid any matrix work.
   * @return false if fewer than k shards are available.
   */
  bool minimumToDecode(const std::set<size_t> &available,
                       std::set<size_t> *minimum) const;
};

/**
 * @brief Systematic Cauchy Reed-Solomon code over GF(2^8), backed by
 * jerasure.
 *
 * The coding matrix comes from cauchy_good_general_coding_matrix(), so any
 * k of the k+m shards recover the payload. Shards are padded to a multiple
 * of kShardAlignment bytes as jerasure's region operations require.
 */
class ReedSolomonCoder : public ErasureCoder {
public:
  static constexpr int kWordSize = 8;
  static constexpr size_t kShardAlignment = 16;

  /** @throws std::invalid_argument if k == 0 or k + m > 256. */
  ReedSolomonCoder(size_t dataShards, size_t parityShards);

  size_t dataShards() const override { return k_; }
  size_t parityShards() const override { return m_; }
  size_t shardSize(size_t payloadSize) const override;

  std::vector<Shard> encode(const std::vector<std::byte> &payload) const override;
  std::vector<std::byte> decode(const ShardMap &available,
                                size_t payloadSize) const override;
  std::vector<Shard> reconstructAll(const ShardMap &available,
                                    size_t payloadSize) const override;

private:
  /**
   * @brief Recover shards from any k usable ones.
   * @param withParity Also rebuild the parity shards; otherwise only the
   *        first k entries of the result are meaningful.
   */
  std::vector<Shard> recover(const ShardMap &available, size_t payloadSize,
                             bool withParity) const;

  size_t k_;
  size_t m_;
  std::vector<int> matrix_; ///< m x k, row-major, as jerasure expects
};

} // namespace chunkvault

#endif // CHUNKVAULT_ERASURE_CODER_HPP
