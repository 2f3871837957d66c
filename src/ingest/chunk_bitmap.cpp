#include "ingest/chunk_bitmap.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace chunkvault {

ChunkBitmap::ChunkBitmap(uint64_t size)
    : words_(static_cast<size_t>(size / 64 + (size % 64 != 0)), 0),
      size_(size) {}

bool ChunkBitmap::set(uint64_t index) {
  if (index >= size_) {
    throw std::out_of_range("chunk index " + std::to_string(index) +
                            " outside bitmap of " + std::to_string(size_));
  }
  uint64_t &word = words_[index / 64];
  const uint64_t bit = uint64_t{1} << (index % 64);
  if (word & bit)
    return false;
  word |= bit;
  ++count_;
  return true;
}

bool ChunkBitmap::test(uint64_t index) const {
  if (index >= size_)
    return false;
  return (words_[index / 64] >> (index % 64)) & 1u;
}

void ChunkBitmap::clear() {
  std::fill(words_.begin(), words_.end(), 0);
  count_ = 0;
}

std::vector<uint64_t> ChunkBitmap::missing() const {
  std::vector<uint64_t> out;
  out.reserve(static_cast<size_t>(size_ - count_));
  for (uint64_t i = 0; i < size_; ++i) {
    if (!test(i))
      out.push_back(i);
  }
  return out;
}

} // namespace chunkvault
