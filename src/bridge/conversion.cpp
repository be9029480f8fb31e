// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "bridge/conversion.hpp"
#include <algorithm>

namespace swaprelay {
namespace bridge {

std::optional<BridgeAddress> AddressWidthConverter::Resize(const BridgeAddress& a,
                                                           size_t from, size_t to) {
  if (a.size() != from) {
    return std::nullopt;
  }
  if (to >= from) {
    std::vector<uint8_t> out(to - from, 0);
    out.insert(out.end(), a.bytes.begin(), a.bytes.end());
    return BridgeAddress(std::move(out));
  }
  const size_t drop = from - to;
  if (!std::all_of(a.bytes.begin(), a.bytes.begin() + drop,
                   [](uint8_t b) { return b == 0; })) {
    return std::nullopt;
  }
  return BridgeAddress(std::vector<uint8_t>(a.bytes.begin() + drop, a.bytes.end()));
}

std::optional<BridgeAddress> AddressWidthConverter::ToChain1Address(const BridgeAddress& a) const {
  return Resize(a, chain2_width_, chain1_width_);
}

std::optional<BridgeAddress> AddressWidthConverter::ToChain2Address(const BridgeAddress& a) const {
  return Resize(a, chain1_width_, chain2_width_);
}

std::shared_ptr<const ChainConverter> MakeConverter(size_t chain1_width, size_t chain2_width) {
  if (chain1_width == chain2_width) {
    return std::make_shared<IdentityConverter>();
  }
  return std::make_shared<AddressWidthConverter>(chain1_width, chain2_width);
}

std::optional<BridgeAddress> DirectedConverter::ConvertAddress(const BridgeAddress& source_address) const {
  return destination_ == ChainSide::Chain2 ? converter_->ToChain2Address(source_address)
                                           : converter_->ToChain1Address(source_address);
}

std::optional<HashLock> DirectedConverter::ConvertHashLock(const HashLock& source_hash) const {
  return destination_ == ChainSide::Chain2 ? converter_->ToChain2HashLock(source_hash)
                                           : converter_->ToChain1HashLock(source_hash);
}

std::optional<LockDetails> DirectedConverter::ToLockDetails(const BridgeTransferDetails& source) const {
  auto initiator = ConvertAddress(source.initiator_address);
  auto recipient = ConvertAddress(source.recipient_address);
  auto hash_lock = ConvertHashLock(source.hash_lock);
  if (!initiator || !recipient || !hash_lock) {
    return std::nullopt;
  }

  LockDetails lock;
  lock.bridge_transfer_id = source.bridge_transfer_id;
  lock.initiator_address = std::move(*initiator);
  lock.recipient_address = std::move(*recipient);
  lock.hash_lock = *hash_lock;
  lock.time_lock = source.time_lock;
  lock.amount = source.amount;
  return lock;
}

} // namespace bridge
} // namespace swaprelay
