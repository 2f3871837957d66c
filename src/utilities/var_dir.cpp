#include "utilities/var_dir.hpp"

#include <cstdlib>
#include <filesystem>

namespace chunkvault {

static std::string varDir = [] {
  const char *env = std::getenv("CHUNKVAULT_VAR_DIR");
  if (env && env[0] != '\0') {
    return std::string(env);
  }
  if (std::filesystem::exists("/var/lib/chunkvault"))
    return std::string("/var/lib/chunkvault");
  return std::string("var/chunkvault");
}();

void setVarDir(const std::string &dir) { varDir = dir; }

const std::string &getVarDir() { return varDir; }

std::string logsDir() { return getVarDir() + "/logs"; }

std::string defaultStorageRoot() { return getVarDir() + "/storage"; }

std::string indexSnapshotPath() { return getVarDir() + "/metadata_index.yaml"; }

} // namespace chunkvault
