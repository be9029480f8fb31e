// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2020 The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util/uint.hpp"

#include <iomanip>
#include <sstream>

// Helper function to convert hex character to value
static inline int HexDigit(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

template <unsigned int BITS> std::string base_blob<BITS>::GetHex() const {
  std::stringstream ss;
  ss << std::hex << std::setfill('0');
  for (int i = 0; i < WIDTH; ++i) {
    ss << std::setw(2) << static_cast<unsigned int>(m_data[i]);
  }
  return ss.str();
}

template <unsigned int BITS>
bool base_blob<BITS>::SetHex(std::string_view str) {
  SetNull();

  // Skip 0x prefix if present
  if (str.size() >= 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X')) {
    str.remove_prefix(2);
  }

  if (str.size() != static_cast<size_t>(WIDTH) * 2) {
    return false;
  }

  std::array<uint8_t, WIDTH> parsed{};
  for (int i = 0; i < WIDTH; ++i) {
    int hi = HexDigit(str[2 * i]);
    int lo = HexDigit(str[2 * i + 1]);
    if (hi < 0 || lo < 0) {
      return false;
    }
    parsed[i] = static_cast<uint8_t>((hi << 4) | lo);
  }
  m_data = parsed;
  return true;
}

template <unsigned int BITS> std::string base_blob<BITS>::ToString() const {
  return GetHex();
}

// Explicit instantiations for base_blob<256>
template std::string base_blob<256>::GetHex() const;
template bool base_blob<256>::SetHex(std::string_view);
template std::string base_blob<256>::ToString() const;

// Static constants
const uint256 uint256::ZERO(0);
const uint256 uint256::ONE(1);
