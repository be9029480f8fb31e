// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/fs_lock.hpp"
#include "util/logging.hpp"
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <unistd.h>

namespace swaprelay {
namespace util {

static std::string GetErrorReason() { return std::strerror(errno); }

DirectoryLock::DirectoryLock(fs::path directory, std::string lockfile_name)
    : path_(std::move(directory) / lockfile_name) {}

DirectoryLock::~DirectoryLock() { Release(); }

LockResult DirectoryLock::Acquire() {
  if (fd_ != -1) {
    return LockResult::Success;
  }

  // O_CLOEXEC: don't leak the lock into child processes
  int fd = open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd == -1) {
    reason_ = GetErrorReason();
    LOG_ERROR("Failed to open lock file {}: {}", path_.string(), reason_);
    return LockResult::ErrorWrite;
  }

  struct flock lock;
  std::memset(&lock, 0, sizeof(lock));
  lock.l_type = F_WRLCK; // Exclusive write lock
  lock.l_whence = SEEK_SET;
  lock.l_start = 0;
  lock.l_len = 0; // Lock entire file

  if (fcntl(fd, F_SETLK, &lock) == -1) {
    reason_ = GetErrorReason();
    close(fd);
    LOG_ERROR("Failed to lock {}: {}", path_.string(), reason_);
    return LockResult::ErrorLock;
  }

  fd_ = fd;
  LOG_TRACE("Acquired directory lock: {}", path_.string());
  return LockResult::Success;
}

void DirectoryLock::Release() {
  if (fd_ == -1) {
    return;
  }
  // Closing the fd releases the fcntl lock
  close(fd_);
  fd_ = -1;
  LOG_TRACE("Released directory lock: {}", path_.string());
}

} // namespace util
} // namespace swaprelay
