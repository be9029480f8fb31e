// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "bridge/types.hpp"
#include "util/string_parsing.hpp"

namespace swaprelay {
namespace bridge {

std::string BridgeAddress::ToString() const {
  return "0x" + util::HexStr(bytes);
}

} // namespace bridge
} // namespace swaprelay
