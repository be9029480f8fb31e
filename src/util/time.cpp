// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/time.hpp"
#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace swaprelay {
namespace util {

// 0 means mock time is disabled (use real time)
static std::atomic<int64_t> g_mock_time{0};

int64_t GetTime() {
  int64_t mock = g_mock_time.load(std::memory_order_relaxed);
  if (mock != 0) {
    return mock;
  }

  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

void SetMockTime(int64_t time) {
  g_mock_time.store(time, std::memory_order_relaxed);
}

int64_t GetMockTime() { return g_mock_time.load(std::memory_order_relaxed); }

std::string FormatTime(int64_t unix_time) {
  if (unix_time == 0) {
    return "1970-01-01 00:00:00 UTC";
  }

  std::time_t t = static_cast<std::time_t>(unix_time);
  std::tm tm_utc;
  if (!gmtime_r(&t, &tm_utc)) {
    return "invalid";
  }

  std::ostringstream oss;
  oss << std::put_time(&tm_utc, "%Y-%m-%d %H:%M:%S UTC");
  return oss.str();
}

} // namespace util
} // namespace swaprelay
