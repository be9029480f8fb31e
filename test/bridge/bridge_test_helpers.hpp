// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "bridge/contract_events.hpp"
#include "bridge/types.hpp"
#include <cstdint>
#include <vector>

namespace swaprelay {
namespace test {

// Address of `width` bytes whose last byte is `tag`
inline bridge::BridgeAddress MakeAddress(uint8_t tag, size_t width = 32) {
  std::vector<uint8_t> bytes(width, 0);
  bytes[width - 1] = tag;
  return bridge::BridgeAddress(std::move(bytes));
}

inline bridge::BridgeTransferId MakeId(uint8_t n) { return uint256(n); }

inline bridge::BridgeTransferDetails MakeTransfer(uint8_t n, uint64_t amount = 1000,
                                                  size_t address_width = 32) {
  bridge::BridgeTransferDetails d;
  d.bridge_transfer_id = MakeId(n);
  d.initiator_address = MakeAddress(0xa0, address_width);
  d.recipient_address = MakeAddress(0xb0, address_width);
  d.hash_lock = uint256(static_cast<uint8_t>(0x80 + n));
  d.time_lock = 3600;
  d.amount = amount;
  return d;
}

inline bridge::CompletedDetails MakeCompleted(uint8_t n, uint8_t secret = 0x55,
                                              size_t address_width = 32) {
  bridge::CompletedDetails d;
  d.bridge_transfer_id = MakeId(n);
  d.initiator_address = MakeAddress(0xa0, address_width);
  d.recipient_address = MakeAddress(0xb0, address_width);
  d.hash_lock = uint256(static_cast<uint8_t>(0x80 + n));
  d.secret = uint256(secret);
  d.amount = 1000;
  return d;
}

inline bridge::LockDetails MakeLock(uint8_t n, size_t address_width = 32) {
  bridge::BridgeTransferDetails t = MakeTransfer(n, 1000, address_width);
  bridge::LockDetails d;
  d.bridge_transfer_id = t.bridge_transfer_id;
  d.initiator_address = t.initiator_address;
  d.recipient_address = t.recipient_address;
  d.hash_lock = t.hash_lock;
  d.time_lock = t.time_lock;
  d.amount = t.amount;
  return d;
}

inline bridge::ContractEvent Initiated(const bridge::BridgeTransferDetails& d) {
  return bridge::ContractEvent::FromInitiator(bridge::InitiatorEvent::Initiated(d));
}

inline bridge::ContractEvent Refunded(const bridge::BridgeTransferDetails& d) {
  return bridge::ContractEvent::FromInitiator(bridge::InitiatorEvent::Refunded(d));
}

inline bridge::ContractEvent InitiatorCompleted(const bridge::CompletedDetails& d) {
  return bridge::ContractEvent::FromInitiator(bridge::InitiatorEvent::Completed(d));
}

inline bridge::ContractEvent Locked(const bridge::LockDetails& d) {
  return bridge::ContractEvent::FromCounterparty(bridge::CounterpartyEvent::Locked(d));
}

inline bridge::ContractEvent CounterpartyCompleted(const bridge::CompletedDetails& d) {
  return bridge::ContractEvent::FromCounterparty(bridge::CounterpartyEvent::Completed(d));
}

} // namespace test
} // namespace swaprelay
