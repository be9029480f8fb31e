// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "util/uint.hpp"
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace swaprelay {
namespace bridge {

// Identifier of one swap attempt, unique within a relay direction
using BridgeTransferId = uint256;

// Commitment binding a claim to knowledge of the pre-image
using HashLock = uint256;

// The secret revealed when the recipient claims
using HashLockPreImage = uint256;

using Amount = uint64_t;
using TimeLock = uint64_t;

// Chain-specific account address. Width differs per chain (20 bytes on EVM
// chains, 32 bytes on Move chains), so it is kept as an opaque byte string.
struct BridgeAddress {
  std::vector<uint8_t> bytes;

  BridgeAddress() = default;
  explicit BridgeAddress(std::vector<uint8_t> b) : bytes(std::move(b)) {}

  size_t size() const { return bytes.size(); }
  bool empty() const { return bytes.empty(); }

  std::string ToString() const;

  friend bool operator==(const BridgeAddress& a, const BridgeAddress& b) {
    return a.bytes == b.bytes;
  }
  friend bool operator!=(const BridgeAddress& a, const BridgeAddress& b) {
    return !(a == b);
  }
};

// Initiator side record: emitted with Initiated and Refunded
struct BridgeTransferDetails {
  BridgeTransferId bridge_transfer_id;
  BridgeAddress initiator_address;
  BridgeAddress recipient_address;
  HashLock hash_lock;
  TimeLock time_lock{0};
  Amount amount{0};

  bool operator==(const BridgeTransferDetails&) const = default;
};

// Counterparty lock record: argument of the lock call and payload of Locked
struct LockDetails {
  BridgeTransferId bridge_transfer_id;
  BridgeAddress initiator_address;
  BridgeAddress recipient_address;
  HashLock hash_lock;
  TimeLock time_lock{0};
  Amount amount{0};

  bool operator==(const LockDetails&) const = default;
};

// Emitted by either contract once funds were claimed with the pre-image
struct CompletedDetails {
  BridgeTransferId bridge_transfer_id;
  BridgeAddress initiator_address;
  BridgeAddress recipient_address;
  HashLock hash_lock;
  HashLockPreImage secret;
  Amount amount{0};

  bool operator==(const CompletedDetails&) const = default;
};

} // namespace bridge
} // namespace swaprelay
