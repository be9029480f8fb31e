#include "util/files.hpp"
#include <cstdlib>
#include <algorithm>
#include <fstream>

#include <fcntl.h>
#include <unistd.h>

namespace swaprelay {
namespace util {

bool append_line(const std::filesystem::path &path, const std::string &line) {
  // Create parent directory if needed
  auto parent = path.parent_path();
  if (!parent.empty() && !ensure_directory(parent)) {
    return false;
  }

  int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
  if (fd < 0) {
    return false;
  }

  std::string data = line;
  data.push_back('\n');

  // Write data (handle partial writes)
  size_t total = 0;
  while (total < data.size()) {
    ssize_t n = write(fd, data.data() + total, data.size() - total);
    if (n <= 0) {
      close(fd);
      return false;
    }
    total += static_cast<size_t>(n);
  }

  // Sync to disk
  if (fsync(fd) != 0) {
    close(fd);
    return false;
  }

  return close(fd) == 0;
}

std::optional<std::string> read_file_from(const std::filesystem::path &path,
                                          uint64_t offset) {
  std::ifstream file(path, std::ios::binary | std::ios::ate);
  if (!file) {
    return std::nullopt;
  }

  std::streampos pos = file.tellg();
  if (pos == std::streampos(-1)) {
    return std::nullopt;
  }

  const uint64_t size = static_cast<uint64_t>(pos);
  if (size < offset) {
    return std::nullopt;
  }

  // Sanity check: refuse to buffer more than 100MB per read
  constexpr uint64_t MAX_READ_SIZE = 100 * 1024 * 1024;
  const uint64_t length = std::min<uint64_t>(size - offset, MAX_READ_SIZE);

  std::string data(static_cast<size_t>(length), '\0');
  file.seekg(static_cast<std::streamoff>(offset));
  file.read(data.data(), static_cast<std::streamsize>(length));

  if (!file) {
    return std::nullopt;
  }

  return data;
}

bool ensure_directory(const std::filesystem::path &dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  return !ec || std::filesystem::exists(dir);
}

std::filesystem::path get_default_datadir() {
  const char *home = std::getenv("HOME");
  if (home) {
    return std::filesystem::path(home) / ".swaprelay";
  }

  // Fallback to current directory
  return std::filesystem::current_path() / ".swaprelay";
}

} // namespace util
} // namespace swaprelay
