#include "utilities/compressor.hpp"

#include <stdexcept>
#include <string>
#include <zstd.h>

namespace chunkvault {

Compressor::Compressor(int compression_level)
    : compression_level_(compression_level) {
  if (compression_level_ < ZSTD_minCLevel() ||
      compression_level_ > ZSTD_maxCLevel()) {
    throw std::invalid_argument("zstd compression level out of range: " +
                                std::to_string(compression_level_));
  }
}

std::vector<std::byte>
Compressor::compress(const std::vector<std::byte> &plaintext) const {
  if (plaintext.empty()) {
    return {};
  }

  size_t const bound = ZSTD_compressBound(plaintext.size());
  std::vector<std::byte> compressed(bound);

  size_t const cSize =
      ZSTD_compress(compressed.data(), bound, plaintext.data(),
                    plaintext.size(), compression_level_);
  if (ZSTD_isError(cSize)) {
    throw std::runtime_error(std::string("ZSTD_compress failed: ") +
                             ZSTD_getErrorName(cSize));
  }

  compressed.resize(cSize);
  return compressed;
}

std::vector<std::byte>
Compressor::decompress(const std::vector<std::byte> &compressed,
                       size_t original_size) const {
  if (compressed.empty()) {
    return {};
  }

  unsigned long long const frameSize =
      ZSTD_getFrameContentSize(compressed.data(), compressed.size());
  if (frameSize == ZSTD_CONTENTSIZE_ERROR) {
    throw std::runtime_error("ZSTD_decompress failed: not a zstd frame");
  }
  if (original_size == 0) {
    if (frameSize == ZSTD_CONTENTSIZE_UNKNOWN) {
      throw std::runtime_error(
          "ZSTD_decompress failed: original size unknown");
    }
    original_size = static_cast<size_t>(frameSize);
  } else if (frameSize != ZSTD_CONTENTSIZE_UNKNOWN &&
             frameSize != original_size) {
    throw std::runtime_error("ZSTD_decompress failed: frame declares " +
                             std::to_string(frameSize) + " bytes, expected " +
                             std::to_string(original_size));
  }
  if (original_size == 0) {
    return {};
  }

  std::vector<std::byte> out(original_size);
  size_t const dSize = ZSTD_decompress(out.data(), original_size,
                                       compressed.data(), compressed.size());
  if (ZSTD_isError(dSize)) {
    throw std::runtime_error(std::string("ZSTD_decompress failed: ") +
                             ZSTD_getErrorName(dSize));
  }
  if (dSize != original_size) {
    throw std::runtime_error(
        "ZSTD_decompress failed: output size does not match original size.");
  }
  return out;
}

} // namespace chunkvault
