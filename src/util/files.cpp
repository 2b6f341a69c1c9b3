// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#include "util/files.hpp"

#include "util/logging.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <random>

#include <fcntl.h>
#include <unistd.h>

namespace strata {
namespace util {

namespace {

// Persisted chain files never legitimately approach this size.
constexpr std::streamsize MAX_READ_SIZE = 512 * 1024 * 1024;

bool fsync_fd(int fd) {
#if defined(__APPLE__)
  return fcntl(fd, F_FULLFSYNC, 0) == 0;
#else
  return fsync(fd) == 0;
#endif
}

bool fsync_dir(const std::filesystem::path& dir) {
#if defined(__APPLE__)
  int fd = open(dir.c_str(), O_RDONLY);
#else
  int fd = open(dir.c_str(), O_RDONLY | O_DIRECTORY);
#endif
  if (fd < 0)
    return false;
  bool ok = fsync_fd(fd);
  close(fd);
  return ok;
}

std::string temp_suffix() {
  static thread_local std::mt19937_64 gen(std::random_device{}());
  char buf[20];
  snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(gen()));
  return std::string(buf);
}

bool ensure_directory(const std::filesystem::path& dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  return !ec || std::filesystem::exists(dir);
}

}  // namespace

bool atomic_write_file(const std::filesystem::path& path, const std::string& data) {
  auto parent = path.parent_path();
  if (!parent.empty() && !ensure_directory(parent)) {
    LOG_ERROR("atomic_write_file: cannot create directory {}", parent.string());
    return false;
  }

  auto temp_path = path;
  temp_path += ".tmp." + temp_suffix();

  // O_EXCL | O_NOFOLLOW: refuse pre-created temp files and symlinks
  int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW, 0644);
  if (fd < 0) {
    LOG_ERROR("atomic_write_file: cannot create {}: {}", temp_path.string(), std::strerror(errno));
    return false;
  }

  size_t written = 0;
  while (written < data.size()) {
    ssize_t n = write(fd, data.data() + written, data.size() - written);
    if (n <= 0) {
      LOG_ERROR("atomic_write_file: write to {} failed after {}/{} bytes: {}", temp_path.string(), written,
                data.size(), std::strerror(errno));
      close(fd);
      std::filesystem::remove(temp_path);
      return false;
    }
    written += static_cast<size_t>(n);
  }

  if (!fsync_fd(fd)) {
    LOG_ERROR("atomic_write_file: fsync of {} failed: {}", temp_path.string(), std::strerror(errno));
    close(fd);
    std::filesystem::remove(temp_path);
    return false;
  }
  close(fd);

  std::error_code ec;
  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    LOG_ERROR("atomic_write_file: rename {} -> {} failed: {}", temp_path.string(), path.string(), ec.message());
    std::filesystem::remove(temp_path);
    return false;
  }

  if (!parent.empty() && !fsync_dir(parent)) {
    LOG_WARN("atomic_write_file: fsync of directory {} failed: {}", parent.string(), std::strerror(errno));
  }
  return true;
}

std::string read_file_string(const std::filesystem::path& path) {
  std::ifstream file(path, std::ios::binary | std::ios::ate);
  if (!file) {
    LOG_ERROR("read_file: cannot open {}: {}", path.string(), std::strerror(errno));
    return {};
  }

  std::streampos pos = file.tellg();
  if (pos == std::streampos(-1)) {
    LOG_ERROR("read_file: cannot size {}", path.string());
    return {};
  }
  std::streamsize size = static_cast<std::streamsize>(pos);
  if (size > MAX_READ_SIZE) {
    LOG_ERROR("read_file: {} is {} bytes, refusing to read more than {}", path.string(), size, MAX_READ_SIZE);
    return {};
  }

  std::string data(static_cast<size_t>(size), '\0');
  file.seekg(0);
  file.read(data.data(), size);
  if (!file) {
    LOG_ERROR("read_file: short read on {}", path.string());
    return {};
  }
  return data;
}

}  // namespace util
}  // namespace strata
