#include "util/string_parsing.hpp"
#include <cctype>
#include <stdexcept>

namespace swaprelay {
namespace util {

namespace {

std::string StripHexPrefix(const std::string& str) {
  if (str.size() >= 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X')) {
    return str.substr(2);
  }
  return str;
}

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

std::optional<int> SafeParseInt(const std::string& str, int min, int max) {
  // Reject empty or whitespace-leading strings
  if (str.empty() || std::isspace(static_cast<unsigned char>(str[0]))) {
    return std::nullopt;
  }

  try {
    size_t pos = 0;
    long value = std::stol(str, &pos);

    // Check entire string was consumed
    if (pos != str.size()) {
      return std::nullopt;
    }

    if (value < min || value > max) {
      return std::nullopt;
    }

    return static_cast<int>(value);
  } catch (const std::invalid_argument&) {
    return std::nullopt;
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

std::optional<int64_t> SafeParseInt64(const std::string& str, int64_t min, int64_t max) {
  if (str.empty() || std::isspace(static_cast<unsigned char>(str[0]))) {
    return std::nullopt;
  }

  try {
    size_t pos = 0;
    long long value = std::stoll(str, &pos);

    if (pos != str.size()) {
      return std::nullopt;
    }

    if (value < min || value > max) {
      return std::nullopt;
    }

    return static_cast<int64_t>(value);
  } catch (const std::invalid_argument&) {
    return std::nullopt;
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

bool IsValidHex(const std::string& str) {
  if (str.empty()) {
    return false;
  }

  for (char c : str) {
    if (!std::isxdigit(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

std::optional<uint256> SafeParseHash(const std::string& str) {
  const std::string hex = StripHexPrefix(str);
  if (hex.size() != 64 || !IsValidHex(hex)) {
    return std::nullopt;
  }

  uint256 hash;
  if (!hash.SetHex(hex)) {
    return std::nullopt;
  }
  return hash;
}

std::optional<std::vector<uint8_t>> ParseHex(const std::string& str) {
  const std::string hex = StripHexPrefix(str);
  if (hex.size() % 2 != 0) {
    return std::nullopt;
  }

  std::vector<uint8_t> out;
  out.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    int hi = HexValue(hex[i]);
    int lo = HexValue(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    out.push_back(static_cast<uint8_t>((hi << 4) | lo));
  }
  return out;
}

std::string HexStr(std::span<const uint8_t> bytes) {
  static const char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(bytes.size() * 2);
  for (uint8_t b : bytes) {
    out.push_back(kDigits[b >> 4]);
    out.push_back(kDigits[b & 0x0f]);
  }
  return out;
}

std::vector<std::string> SplitList(const std::string& str, char separator) {
  std::vector<std::string> items;
  size_t pos = 0;
  while (pos <= str.size()) {
    size_t next = str.find(separator, pos);
    if (next == std::string::npos) {
      next = str.size();
    }
    if (next > pos) {
      items.push_back(str.substr(pos, next - pos));
    }
    pos = next + 1;
  }
  return items;
}

} // namespace util
} // namespace swaprelay
