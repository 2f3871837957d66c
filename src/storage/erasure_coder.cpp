#include "storage/erasure_coder.hpp"
#include "utilities/errors.hpp"

#include <algorithm>
#include <cstdlib>
#include <mutex>
#include <stdexcept>
#include <string>

extern "C" {
#include "cauchy.h"
#include "galois.h"
#include "jerasure.h"
}

namespace chunkvault {

namespace {

// jerasure initialises GF(2^w) lazily and without locking.
void initGaloisField() {
  static std::once_flag once;
  std::call_once(once, [] {
    if (galois_init_default_field(ReedSolomonCoder::kWordSize) != 0) {
      throw std::runtime_error("gf-complete could not initialise GF(2^8)");
    }
  });
}

std::vector<char *> bufferPointers(std::vector<Shard> &shards, size_t begin,
                                   size_t count) {
  std::vector<char *> ptrs(count);
  for (size_t i = 0; i < count; ++i)
    ptrs[i] = reinterpret_cast<char *>(shards[begin + i].data());
  return ptrs;
}

} // namespace

std::vector<Shard> ErasureCoder::reconstructAll(const ShardMap &available,
                                                size_t payloadSize) const {
  return encode(decode(available, payloadSize));
}

bool ErasureCoder::minimumToDecode(const std::set<size_t> &available,
                                   std::set<size_t> *minimum) const {
  std::set<size_t> chosen;
  for (size_t idx : available) {
    if (idx >= totalShards())
      continue;
    chosen.insert(idx);
    if (chosen.size() == dataShards())
      break;
  }
  if (chosen.size() < dataShards())
    return false;
  if (minimum)
    *minimum = std::move(chosen);
  return true;
}

ReedSolomonCoder::ReedSolomonCoder(size_t dataShards, size_t parityShards)
    : k_(dataShards), m_(parityShards) {
  if (k_ == 0) {
    throw std::invalid_argument("Reed-Solomon needs at least one data shard");
  }
  if (k_ + m_ > (size_t{1} << kWordSize)) {
    throw std::invalid_argument("Reed-Solomon over GF(256) supports at most "
                                "256 shards, got " +
                                std::to_string(k_ + m_));
  }
  if (m_ == 0)
    return;

  initGaloisField();
  int *matrix = cauchy_good_general_coding_matrix(
      static_cast<int>(k_), static_cast<int>(m_), kWordSize);
  if (!matrix) {
    throw std::runtime_error("jerasure returned no coding matrix for k=" +
                             std::to_string(k_) +
                             ", m=" + std::to_string(m_));
  }
  matrix_.assign(matrix, matrix + k_ * m_);
  std::free(matrix);
}

size_t ReedSolomonCoder::shardSize(size_t payloadSize) const {
  size_t perShard = (payloadSize + k_ - 1) / k_;
  return (perShard + kShardAlignment - 1) / kShardAlignment * kShardAlignment;
}

std::vector<Shard>
ReedSolomonCoder::encode(const std::vector<std::byte> &payload) const {
  const size_t len = shardSize(payload.size());
  std::vector<Shard> shards(k_ + m_, Shard(len, std::byte{0}));

  for (size_t j = 0; j < k_; ++j) {
    size_t begin = j * len;
    if (begin >= payload.size())
      break;
    size_t end = std::min(begin + len, payload.size());
    std::copy(payload.begin() + begin, payload.begin() + end,
              shards[j].begin());
  }
  if (m_ == 0 || len == 0)
    return shards;

  std::vector<char *> data = bufferPointers(shards, 0, k_);
  std::vector<char *> coding = bufferPointers(shards, k_, m_);
  jerasure_matrix_encode(static_cast<int>(k_), static_cast<int>(m_),
                         kWordSize, const_cast<int *>(matrix_.data()),
                         data.data(), coding.data(), static_cast<int>(len));
  return shards;
}

std::vector<Shard> ReedSolomonCoder::recover(const ShardMap &available,
                                             size_t payloadSize,
                                             bool withParity) const {
  const size_t len = shardSize(payloadSize);
  std::set<size_t> usable;
  for (const auto &kv : available) {
    if (kv.first < k_ + m_ && kv.second.size() == len)
      usable.insert(kv.first);
  }

  std::set<size_t> chosen;
  if (!minimumToDecode(usable, &chosen)) {
    ThrowVaultException(ErrorCode::InsufficientShards,
                        "need " + std::to_string(k_) + " shards, only " +
                            std::to_string(usable.size()) + " usable");
  }

  std::vector<Shard> shards(k_ + m_);
  std::vector<int> erasures;
  for (size_t i = 0; i < k_ + m_; ++i) {
    if (chosen.count(i)) {
      shards[i] = available.at(i);
    } else {
      shards[i].assign(len, std::byte{0});
      erasures.push_back(static_cast<int>(i));
    }
  }
  const bool allData = *chosen.rbegin() < k_;
  if ((allData && !withParity) || m_ == 0 || len == 0)
    return shards;
  erasures.push_back(-1);

  std::vector<char *> data = bufferPointers(shards, 0, k_);
  std::vector<char *> coding = bufferPointers(shards, k_, m_);
  int rc = jerasure_matrix_decode(
      static_cast<int>(k_), static_cast<int>(m_), kWordSize,
      const_cast<int *>(matrix_.data()), 0, erasures.data(), data.data(),
      coding.data(), static_cast<int>(len));
  if (rc != 0) {
    ThrowVaultException(ErrorCode::InsufficientShards,
                        "jerasure could not decode " +
                            std::to_string(k_) + "+" + std::to_string(m_) +
                            " shards with " +
                            std::to_string(erasures.size() - 1) + " erased");
  }
  return shards;
}

std::vector<std::byte> ReedSolomonCoder::decode(const ShardMap &available,
                                                size_t payloadSize) const {
  std::vector<Shard> shards = recover(available, payloadSize, false);
  std::vector<std::byte> payload;
  payload.reserve(k_ * shardSize(payloadSize));
  for (size_t j = 0; j < k_; ++j)
    payload.insert(payload.end(), shards[j].begin(), shards[j].end());
  payload.resize(payloadSize);
  return payload;
}

std::vector<Shard> ReedSolomonCoder::reconstructAll(const ShardMap &available,
                                                    size_t payloadSize) const {
  return recover(available, payloadSize, true);
}

} // namespace chunkvault
