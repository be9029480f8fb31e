// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <string>

namespace swaprelay {
namespace util {

/**
 * Mockable wall clock
 *
 * Production code stamps relay events with GetTime(); tests pin the clock
 * with SetMockTime() / MockTimeScope so emitted timestamps are deterministic.
 * A mock time of 0 means "use the real system clock".
 */

/**
 * Get current time as Unix timestamp (seconds since epoch)
 * Returns mock time if set, otherwise returns real system time
 */
int64_t GetTime();

/**
 * Set mock time for testing
 *
 * @param time Unix timestamp in seconds (0 to disable mocking)
 */
void SetMockTime(int64_t time);

/**
 * Get current mock time setting
 * Returns 0 if mock time is disabled (using real time)
 */
int64_t GetMockTime();

/**
 * Format a Unix timestamp as a human-readable UTC string
 *
 * Example: FormatTime(1729868000) -> "2024-10-25 14:53:20 UTC"
 */
std::string FormatTime(int64_t unix_time);

/**
 * RAII helper to set mock time and restore it when scope exits
 */
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time) : previous_time_(GetMockTime()) {
    SetMockTime(time);
  }

  ~MockTimeScope() { SetMockTime(previous_time_); }

  MockTimeScope(const MockTimeScope&) = delete;
  MockTimeScope& operator=(const MockTimeScope&) = delete;
  MockTimeScope(MockTimeScope&&) = delete;
  MockTimeScope& operator=(MockTimeScope&&) = delete;

private:
  const int64_t previous_time_;
};

} // namespace util
} // namespace swaprelay
