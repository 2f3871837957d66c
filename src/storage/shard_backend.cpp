#include "storage/shard_backend.hpp"
#include "utilities/errors.hpp"

#include <atomic>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>
#include <unistd.h>

namespace chunkvault {

namespace fs = std::filesystem;

namespace {

std::atomic<unsigned long> tmpCounter{0};

std::string errnoText() { return std::strerror(errno); }

void writeAll(int fd, const std::vector<std::byte> &data,
              const std::string &path) {
  const char *p = reinterpret_cast<const char *>(data.data());
  size_t remaining = data.size();
  while (remaining > 0) {
    ssize_t n = ::write(fd, p, remaining);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      std::string err = errnoText();
      ::close(fd);
      ::unlink(path.c_str());
      ThrowVaultException(ErrorCode::StorageWriteFailure,
                          "write to " + path + " failed: " + err);
    }
    p += n;
    remaining -= static_cast<size_t>(n);
  }
}

void syncDirectory(const fs::path &dir) {
  int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
  if (fd < 0)
    return;
  ::fsync(fd);
  ::close(fd);
}

} // namespace

LocalShardBackend::LocalShardBackend(std::string root)
    : root_(std::move(root)) {
  std::error_code ec;
  fs::create_directories(root_, ec);
  if (ec) {
    ThrowVaultException(ErrorCode::StorageWriteFailure,
                        "cannot create storage root " + root_ + ": " +
                            ec.message());
  }
}

std::string LocalShardBackend::write(const std::string &relativePath,
                                     const std::vector<std::byte> &data) {
  fs::path finalPath = fs::path(root_) / relativePath;
  std::error_code ec;
  fs::create_directories(finalPath.parent_path(), ec);
  if (ec) {
    ThrowVaultException(ErrorCode::StorageWriteFailure,
                        "cannot create " + finalPath.parent_path().string() +
                            ": " + ec.message());
  }

  std::string tmpPath = finalPath.string() + ".tmp." +
                        std::to_string(::getpid()) + "." +
                        std::to_string(tmpCounter.fetch_add(1));
  int fd = ::open(tmpPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
  if (fd < 0) {
    ThrowVaultException(ErrorCode::StorageWriteFailure,
                        "open " + tmpPath + " failed: " + errnoText());
  }
  writeAll(fd, data, tmpPath);
  if (::fsync(fd) != 0) {
    std::string err = errnoText();
    ::close(fd);
    ::unlink(tmpPath.c_str());
    ThrowVaultException(ErrorCode::StorageWriteFailure,
                        "fsync " + tmpPath + " failed: " + err);
  }
  if (::close(fd) != 0) {
    std::string err = errnoText();
    ::unlink(tmpPath.c_str());
    ThrowVaultException(ErrorCode::StorageWriteFailure,
                        "close " + tmpPath + " failed: " + err);
  }
  if (::rename(tmpPath.c_str(), finalPath.c_str()) != 0) {
    std::string err = errnoText();
    ::unlink(tmpPath.c_str());
    ThrowVaultException(ErrorCode::StorageWriteFailure,
                        "rename to " + finalPath.string() + " failed: " + err);
  }
  syncDirectory(finalPath.parent_path());
  return finalPath.string();
}

std::optional<std::vector<std::byte>>
LocalShardBackend::read(const std::string &storagePath) const {
  std::error_code ec;
  if (!fs::exists(storagePath, ec)) {
    return std::nullopt;
  }
  std::ifstream in(storagePath, std::ios::binary);
  if (!in.is_open()) {
    ThrowVaultException(ErrorCode::StorageReadFailure,
                        "cannot open shard " + storagePath);
  }
  std::vector<char> tmp((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>());
  if (in.bad()) {
    ThrowVaultException(ErrorCode::StorageReadFailure,
                        "read of shard " + storagePath + " failed");
  }
  std::vector<std::byte> data(tmp.size());
  if (!tmp.empty())
    std::memcpy(data.data(), tmp.data(), tmp.size());
  return data;
}

bool LocalShardBackend::remove(const std::string &storagePath) {
  std::error_code ec;
  return fs::remove(storagePath, ec);
}

} // namespace chunkvault
