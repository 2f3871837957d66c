#ifndef CHUNKVAULT_CHUNK_HASHER_HPP
#define CHUNKVAULT_CHUNK_HASHER_HPP

#include "utilities/digest.hpp"
#include <cstddef>
#include <sodium.h>
#include <string>
#include <vector>

namespace chunkvault {

/**
 * @brief Incremental SHA-256 over chunk or object bytes.
 *
 * A hasher may be fed any number of times with update() and finalized once.
 * The static hash() helper covers the common single-buffer case used for
 * chunk digests; the streaming form is used for whole-object verification.
 */
class ChunkHasher {
public:
  ChunkHasher();

  void update(const std::byte *data, size_t size);
  void update(const std::vector<std::byte> &data) {
    update(data.data(), data.size());
  }

  /**
   * @brief Finish hashing and return the raw digest.
   * @throw std::logic_error If called more than once.
   */
  DigestArray finalize();

  /** Finish hashing and return the hex-encoded digest. */
  std::string finalizeHex() { return digestToHex(finalize()); }

  /** Hex digest of @p data. */
  static std::string hash(const std::vector<std::byte> &data);

private:
  crypto_hash_sha256_state state_;
  bool finalized_ = false;
};

/** Call sodium_init() once, throwing std::runtime_error on failure. */
void ensureSodiumInitialized();

} // namespace chunkvault

#endif // CHUNKVAULT_CHUNK_HASHER_HPP
