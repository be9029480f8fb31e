// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <string>

namespace swaprelay {

// Software version
constexpr int CLIENT_VERSION_MAJOR = 1;
constexpr int CLIENT_VERSION_MINOR = 0;
constexpr int CLIENT_VERSION_PATCH = 0;

// Build version string
inline std::string GetVersionString() {
  return std::to_string(CLIENT_VERSION_MAJOR) + "." +
         std::to_string(CLIENT_VERSION_MINOR) + "." +
         std::to_string(CLIENT_VERSION_PATCH);
}

// Copyright
constexpr const char *COPYRIGHT_YEAR = "2025";
constexpr const char *COPYRIGHT_HOLDERS = "The Unicity Foundation";

// Full version info for display
inline std::string GetFullVersionString() {
  return "SwapRelay version " + GetVersionString();
}

// Get copyright string
inline std::string GetCopyrightString() {
  return "Copyright (C) " + std::string(COPYRIGHT_YEAR) + " " +
         std::string(COPYRIGHT_HOLDERS);
}

// Startup banner naming the relayed chain pair
inline std::string GetStartupBanner(const std::string &chain1,
                                    const std::string &chain2) {
  std::string banner;
  banner += "\n";
  banner += "  SwapRelay " + GetVersionString() + "\n";
  banner += "  Atomic swap relayer: " + chain1 + " <-> " + chain2 + "\n";
  banner += "  " + GetCopyrightString() + "\n\n";
  return banner;
}

} // namespace swaprelay
