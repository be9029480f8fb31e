// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-present The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <string>
#include <string_view>

/** Template base class for fixed-sized opaque blobs. */
template <unsigned int BITS> class base_blob {
protected:
  static constexpr int WIDTH = BITS / 8;
  static_assert(BITS % 8 == 0,
                "base_blob currently only supports whole bytes.");
  std::array<uint8_t, WIDTH> m_data;
  static_assert(WIDTH == sizeof(m_data), "Sanity check");

public:
  /* construct 0 value by default */
  constexpr base_blob() : m_data() {}

  /* constructor for constants between 1 and 255 (stored in the last byte) */
  constexpr explicit base_blob(uint8_t v) : m_data() { m_data[WIDTH - 1] = v; }

  constexpr bool IsNull() const {
    return std::all_of(m_data.begin(), m_data.end(),
                       [](uint8_t val) { return val == 0; });
  }

  constexpr void SetNull() { std::fill(m_data.begin(), m_data.end(), 0); }

  /** Lexicographic ordering */
  int Compare(const base_blob &other) const {
    return std::memcmp(m_data.data(), other.m_data.data(), WIDTH);
  }

  friend bool operator==(const base_blob &a, const base_blob &b) {
    return a.Compare(b) == 0;
  }
  friend bool operator!=(const base_blob &a, const base_blob &b) {
    return a.Compare(b) != 0;
  }
  friend bool operator<(const base_blob &a, const base_blob &b) {
    return a.Compare(b) < 0;
  }

  /** @name Hex representation
   *
   * Bridge contracts publish ids and hash-locks as big-endian byte strings,
   * so GetHex() prints bytes in storage order ("0x" is never emitted) and
   * SetHex() reads them back in the same order.
   *
   * @{*/
  std::string GetHex() const;
  std::string ToString() const;

  /** Set from hex string. Supports optional "0x" prefix.
   *  Returns false (and leaves the blob null) unless the input holds
   *  exactly WIDTH bytes of hex. */
  bool SetHex(std::string_view str);
  /**@}*/

  /** Copy from a byte span; returns false on size mismatch */
  bool SetBytes(std::span<const unsigned char> bytes) {
    if (bytes.size() != WIDTH) {
      return false;
    }
    std::copy(bytes.begin(), bytes.end(), m_data.begin());
    return true;
  }

  constexpr const unsigned char *data() const { return m_data.data(); }
  constexpr unsigned char *data() { return m_data.data(); }

  constexpr unsigned char *begin() { return m_data.data(); }
  constexpr unsigned char *end() { return m_data.data() + WIDTH; }

  constexpr const unsigned char *begin() const { return m_data.data(); }
  constexpr const unsigned char *end() const { return m_data.data() + WIDTH; }

  static constexpr unsigned int size() { return WIDTH; }
};

/** 256-bit opaque blob.
 * @note Used for bridge transfer ids, hash-locks and pre-images. It has no
 * integer operations.
 */
class uint256 : public base_blob<256> {
public:
  constexpr uint256() = default;
  constexpr explicit uint256(uint8_t v) : base_blob<256>(v) {}

  static const uint256 ZERO;
  static const uint256 ONE;
};

/* uint256 from a hex string, null on malformed input.
 * This is a separate function because the constructor uint256(const std::string
 * &str) can result in dangerously catching uint256(0) via std::string(const
 * char*).
 */
inline uint256 uint256S(std::string_view str) {
  uint256 rv;
  rv.SetHex(str);
  return rv;
}
