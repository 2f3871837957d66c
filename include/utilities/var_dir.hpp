#pragma once

#include <string>

namespace chunkvault {

void setVarDir(const std::string &dir);
const std::string &getVarDir();

std::string logsDir();
std::string defaultStorageRoot();
std::string indexSnapshotPath();

} // namespace chunkvault
