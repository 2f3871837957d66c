#ifndef CHUNKVAULT_DIGEST_CLAIMS_HPP
#define CHUNKVAULT_DIGEST_CLAIMS_HPP

#include <condition_variable>
#include <mutex>
#include <string>
#include <unordered_set>

namespace chunkvault {

/**
 * @brief Per-digest mutual exclusion shared by ingest and garbage collection.
 *
 * An admission holds the claim from its dedup lookup until the manifest row
 * naming the digest is written; the collector holds it while deciding to
 * delete. Claims on different digests never block each other.
 */
class DigestClaims {
public:
  /// Holds the claim on one digest for its lifetime.
  class Claim {
  public:
    Claim(DigestClaims &claims, std::string digest);
    ~Claim();
    Claim(const Claim &) = delete;
    Claim &operator=(const Claim &) = delete;

  private:
    DigestClaims &claims_;
    std::string digest_;
  };

private:
  std::mutex mutex_;
  std::condition_variable released_;
  std::unordered_set<std::string> claimed_;
};

} // namespace chunkvault

#endif // CHUNKVAULT_DIGEST_CLAIMS_HPP
