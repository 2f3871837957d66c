#ifndef CHUNKVAULT_COMPRESSOR_HPP
#define CHUNKVAULT_COMPRESSOR_HPP

#include <cstddef>
#include <vector>

namespace chunkvault {

/**
 * @brief zstd wrapper used on every chunk before erasure coding.
 *
 * Empty input compresses to an empty payload and decompresses back to empty,
 * so decompress(compress(x)) == x holds for every byte sequence.
 */
class Compressor {
public:
  explicit Compressor(int compression_level = 3);

  int level() const { return compression_level_; }

  std::vector<std::byte> compress(const std::vector<std::byte> &plaintext) const;

  /**
   * @brief Decompress a payload produced by compress().
   * @param original_size Expected raw size; 0 means read it from the frame.
   * @throw std::runtime_error If the frame is malformed or sizes disagree.
   */
  std::vector<std::byte> decompress(const std::vector<std::byte> &compressed,
                                    size_t original_size = 0) const;

private:
  int compression_level_;
};

} // namespace chunkvault

#endif // CHUNKVAULT_COMPRESSOR_HPP
