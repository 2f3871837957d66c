#include "metadata/chunk_meta.hpp"

#include <stdexcept>

namespace chunkvault {

const char *tierName(StorageTier tier) {
  switch (tier) {
  case StorageTier::Hot:
    return "hot";
  case StorageTier::Warm:
    return "warm";
  case StorageTier::Cold:
    return "cold";
  }
  return "hot";
}

StorageTier parseTier(const std::string &name) {
  if (name == "hot")
    return StorageTier::Hot;
  if (name == "warm")
    return StorageTier::Warm;
  if (name == "cold")
    return StorageTier::Cold;
  throw std::invalid_argument("Unknown storage tier: " + name);
}

const char *manifestStateName(ManifestState state) {
  switch (state) {
  case ManifestState::Open:
    return "open";
  case ManifestState::Committed:
    return "committed";
  case ManifestState::Invalid:
    return "invalid";
  }
  return "open";
}

ManifestState parseManifestState(const std::string &name) {
  if (name == "open")
    return ManifestState::Open;
  if (name == "committed")
    return ManifestState::Committed;
  if (name == "invalid")
    return ManifestState::Invalid;
  throw std::invalid_argument("Unknown manifest state: " + name);
}

} // namespace chunkvault
