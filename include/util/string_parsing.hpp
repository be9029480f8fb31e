#pragma once

/*
 String Parsing Utilities

 Purpose:
 - Safe parsing of command-line flags and journal payloads
 - Returns std::nullopt on any parsing error (no exceptions thrown)

 Key functions:
 - SafeParseInt / SafeParseInt64: integers with bounds checking
 - SafeParseHash: 64-character hexadecimal id / hash-lock
 - ParseHex / HexStr: variable-width byte strings (chain addresses)
 - SplitList: comma-separated flag values
*/

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

// uint256 must be fully defined for std::optional<uint256>
#include "util/uint.hpp"

namespace swaprelay {
namespace util {

/**
 * Parse integer string with bounds checking
 *
 * Examples:
 *   SafeParseInt("42", 0, 100) -> 42
 *   SafeParseInt("999", 0, 100) -> std::nullopt (out of range)
 *   SafeParseInt("42x", 0, 100) -> std::nullopt (trailing chars)
 *   SafeParseInt("", 0, 100) -> std::nullopt (empty string)
 */
std::optional<int> SafeParseInt(const std::string& str, int min, int max);

/**
 * Parse int64_t string with bounds checking
 *
 * Examples:
 *   SafeParseInt64("86400", 0, 1000000) -> 86400
 *   SafeParseInt64("-1", 0, 1000000) -> std::nullopt (out of range)
 */
std::optional<int64_t> SafeParseInt64(const std::string& str, int64_t min, int64_t max);

/**
 * @return true if str is non-empty and all characters are hex digits
 */
bool IsValidHex(const std::string& str);

/**
 * Parse 64-character hexadecimal hash string (optional "0x" prefix)
 *
 * Examples:
 *   SafeParseHash("0x0123...ef") -> valid uint256
 *   SafeParseHash("123") -> std::nullopt (wrong length)
 */
std::optional<uint256> SafeParseHash(const std::string& str);

/**
 * Parse an even-length hex string (optional "0x" prefix) into bytes
 *
 * Examples:
 *   ParseHex("0xdead") -> {0xde, 0xad}
 *   ParseHex("abc") -> std::nullopt (odd length)
 *   ParseHex("0x") -> {} (empty byte string)
 */
std::optional<std::vector<uint8_t>> ParseHex(const std::string& str);

/**
 * Lower-case hex rendering of bytes, without prefix
 */
std::string HexStr(std::span<const uint8_t> bytes);

/**
 * Split "a,b,,c" into {"a", "b", "c"} (empty items dropped)
 */
std::vector<std::string> SplitList(const std::string& str, char separator = ',');

} // namespace util
} // namespace swaprelay
