#ifndef CHUNKVAULT_CHUNK_BITMAP_HPP
#define CHUNKVAULT_CHUNK_BITMAP_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

namespace chunkvault {

/**
 * @brief Fixed-size received mask for an upload session.
 *
 * Not thread-safe; the owning session serialises access.
 */
class ChunkBitmap {
public:
  ChunkBitmap() = default;
  explicit ChunkBitmap(uint64_t size);

  /**
   * @brief Mark @p index received.
   * @return true if the bit was previously clear.
   * @throws std::out_of_range if @p index >= size().
   */
  bool set(uint64_t index);
  bool test(uint64_t index) const;
  void clear();

  uint64_t size() const { return size_; }
  uint64_t count() const { return count_; }
  bool full() const { return count_ == size_; }

  /** Indices not yet set, ascending. */
  std::vector<uint64_t> missing() const;

private:
  std::vector<uint64_t> words_;
  uint64_t size_ = 0;
  uint64_t count_ = 0;
};

} // namespace chunkvault

#endif // CHUNKVAULT_CHUNK_BITMAP_HPP
