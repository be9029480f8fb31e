// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <filesystem>
#include <string>

namespace swaprelay {
namespace util {

namespace fs = std::filesystem;

/**
 * Result of directory lock attempt
 */
enum class LockResult {
  Success,    // Lock acquired successfully
  ErrorWrite, // Could not create lock file
  ErrorLock,  // Lock already held by another process
};

/**
 * DirectoryLock - exclusive ownership of a data directory
 *
 * Two relayers sharing a datadir would append the same contract calls
 * twice. The lock is an fcntl() write lock on `<directory>/<lockfile>`,
 * held until Release() or destruction. Closing the descriptor releases it,
 * so a crashed process never leaves a stale lock behind.
 */
class DirectoryLock {
public:
  explicit DirectoryLock(fs::path directory, std::string lockfile_name = ".lock");
  ~DirectoryLock();

  DirectoryLock(const DirectoryLock &) = delete;
  DirectoryLock &operator=(const DirectoryLock &) = delete;

  LockResult Acquire();
  void Release();

  bool IsHeld() const { return fd_ != -1; }
  const std::string &GetReason() const { return reason_; }
  const fs::path &path() const { return path_; }

private:
  fs::path path_;
  int fd_{-1};
  std::string reason_;
};

} // namespace util
} // namespace swaprelay
