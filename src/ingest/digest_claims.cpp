#include "ingest/digest_claims.hpp"

namespace chunkvault {

DigestClaims::Claim::Claim(DigestClaims &claims, std::string digest)
    : claims_(claims), digest_(std::move(digest)) {
  std::unique_lock<std::mutex> lock(claims_.mutex_);
  claims_.released_.wait(lock,
                         [this] { return !claims_.claimed_.count(digest_); });
  claims_.claimed_.insert(digest_);
}

DigestClaims::Claim::~Claim() {
  {
    std::lock_guard<std::mutex> lock(claims_.mutex_);
    claims_.claimed_.erase(digest_);
  }
  claims_.released_.notify_all();
}

} // namespace chunkvault
