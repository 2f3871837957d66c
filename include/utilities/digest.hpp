#ifndef CHUNKVAULT_DIGEST_HPP
#define CHUNKVAULT_DIGEST_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace chunkvault {

/// SHA-256 digest size in bytes.
inline constexpr size_t DIGEST_SIZE = 32;
/// Length of a hex-encoded digest.
inline constexpr size_t DIGEST_HEX_LENGTH = DIGEST_SIZE * 2;

using DigestArray = std::array<uint8_t, DIGEST_SIZE>;

/** Lowercase hex encoding of @p digest. */
std::string digestToHex(const DigestArray &digest);

/**
 * @brief Decode a 64 character hex digest.
 * @throws std::invalid_argument if @p hex is not a valid digest.
 */
DigestArray hexToDigest(const std::string &hex);

/** True if @p hex is exactly 64 lowercase or uppercase hex characters. */
bool isValidHexDigest(const std::string &hex);

} // namespace chunkvault

#endif // CHUNKVAULT_DIGEST_HPP
