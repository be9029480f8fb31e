// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "bridge/types.hpp"
#include <string>

namespace swaprelay {
namespace bridge {

/**
 * Contract events as reported by a chain adapter
 *
 * Each chain runs two bridge contracts:
 * - Initiator: where a user locks funds to start a swap (Initiated), where
 *   the relayer claims them with the revealed secret (Completed), and where
 *   the user takes them back after the time-lock expires (Refunded)
 * - Counterparty: where the relayer locks the mirrored funds (Locked) and
 *   where the recipient claims them, revealing the secret (Completed)
 *
 * Events are tagged structs; the payload matching `kind` is the valid one.
 */

enum class InitiatorEventKind { Initiated, Completed, Refunded };

struct InitiatorEvent {
  InitiatorEventKind kind{InitiatorEventKind::Initiated};
  BridgeTransferDetails details;  // Initiated, Refunded
  CompletedDetails completed;     // Completed

  static InitiatorEvent Initiated(BridgeTransferDetails d);
  static InitiatorEvent Completed(CompletedDetails d);
  static InitiatorEvent Refunded(BridgeTransferDetails d);

  const BridgeTransferId& bridge_transfer_id() const;
};

enum class CounterpartyEventKind { Locked, Completed };

struct CounterpartyEvent {
  CounterpartyEventKind kind{CounterpartyEventKind::Locked};
  LockDetails locked;          // Locked
  CompletedDetails completed;  // Completed

  static CounterpartyEvent Locked(LockDetails d);
  static CounterpartyEvent Completed(CompletedDetails d);

  const BridgeTransferId& bridge_transfer_id() const;
};

enum class ContractRole { Initiator, Counterparty };

struct ContractEvent {
  ContractRole role{ContractRole::Initiator};
  InitiatorEvent initiator;
  CounterpartyEvent counterparty;

  static ContractEvent FromInitiator(InitiatorEvent e);
  static ContractEvent FromCounterparty(CounterpartyEvent e);

  const BridgeTransferId& bridge_transfer_id() const;

  // e.g. "initiator.Initiated(3fa1...)"
  std::string ToString() const;
};

std::string ToString(InitiatorEventKind kind);
std::string ToString(CounterpartyEventKind kind);
std::string ToString(ContractRole role);

} // namespace bridge
} // namespace swaprelay
