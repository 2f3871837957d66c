#include "utilities/chunk_hasher.hpp"

#include <cctype>
#include <stdexcept>

namespace chunkvault {

void ensureSodiumInitialized() {
  // sodium_init() returns -1 on error, 0 on success, 1 if already initialized
  if (sodium_init() < 0) {
    throw std::runtime_error("Failed to initialize libsodium");
  }
}

std::string digestToHex(const DigestArray &digest) {
  char hex[DIGEST_HEX_LENGTH + 1];
  sodium_bin2hex(hex, sizeof(hex), digest.data(), digest.size());
  return std::string(hex, DIGEST_HEX_LENGTH);
}

bool isValidHexDigest(const std::string &hex) {
  if (hex.size() != DIGEST_HEX_LENGTH)
    return false;
  for (char c : hex) {
    if (!std::isxdigit(static_cast<unsigned char>(c)))
      return false;
  }
  return true;
}

DigestArray hexToDigest(const std::string &hex) {
  if (!isValidHexDigest(hex)) {
    throw std::invalid_argument("Invalid hex digest: " + hex);
  }
  DigestArray digest{};
  size_t binLen = 0;
  if (sodium_hex2bin(digest.data(), digest.size(), hex.data(), hex.size(),
                     nullptr, &binLen, nullptr) != 0 ||
      binLen != DIGEST_SIZE) {
    throw std::invalid_argument("Invalid hex digest: " + hex);
  }
  return digest;
}

ChunkHasher::ChunkHasher() {
  ensureSodiumInitialized();
  crypto_hash_sha256_init(&state_);
}

void ChunkHasher::update(const std::byte *data, size_t size) {
  if (finalized_) {
    throw std::logic_error("Cannot update a finalized ChunkHasher.");
  }
  if (data && size > 0) {
    crypto_hash_sha256_update(
        &state_, reinterpret_cast<const unsigned char *>(data), size);
  }
}

DigestArray ChunkHasher::finalize() {
  if (finalized_) {
    throw std::logic_error("ChunkHasher::finalize() already called.");
  }
  DigestArray digest{};
  crypto_hash_sha256_final(&state_, digest.data());
  finalized_ = true;
  return digest;
}

std::string ChunkHasher::hash(const std::vector<std::byte> &data) {
  ChunkHasher hasher;
  hasher.update(data);
  return hasher.finalizeHex();
}

} // namespace chunkvault
