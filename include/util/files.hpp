#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace swaprelay {
namespace util {

/**
 * Journal file helpers
 *
 * The relay keeps append-only JSON-lines files (contract call journal,
 * event log). An append is durable once append_line() returns true:
 * the data is written in full and fsync()ed.
 */

/**
 * Append `line` plus a trailing newline to `path`, creating the file
 * (and its parent directory) if needed.
 * Returns true on success, false on failure
 */
bool append_line(const std::filesystem::path &path, const std::string &line);

/**
 * Read from byte `offset` to the end of the file.
 * Returns std::nullopt if the file cannot be opened or is shorter than
 * `offset` (truncated since the last read).
 */
std::optional<std::string> read_file_from(const std::filesystem::path &path,
                                          uint64_t offset);

/**
 * Create directory if it doesn't exist (recursive)
 * Returns true on success or if already exists
 */
bool ensure_directory(const std::filesystem::path &dir);

/**
 * Get default data directory for the application
 * Returns ~/.swaprelay on Unix
 */
std::filesystem::path get_default_datadir();

} // namespace util
} // namespace swaprelay
