// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "bridge/active_swap.hpp"
#include "bridge/contract_events.hpp"
#include "bridge/types.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace swaprelay {
namespace bridge {

/**
 * Unified relay events
 *
 * Every item the BridgeService yields is tagged with the chain and contract
 * role it concerns:
 *   B1I / B1C - chain 1 initiator / counterparty contract
 *   B2I / B2C - chain 2 initiator / counterparty contract
 * and carries one of:
 *   Contract - a contract event observed on-chain (forwarded)
 *   Progress - outcome of a call dispatched by a tracker
 *   Warning  - a protocol anomaly; Critical ones need an operator
 */

enum class EventOrigin { B1I, B1C, B2I, B2C };

enum class EventKind { Contract, Progress, Warning };

enum class WarningKind {
  AlreadyPresent,                // duplicate Initiated for a tracked id
  CannotCompleteUnexistingSwap,  // completion for an id nobody tracks
  LockingFailed,                 // lock retries exhausted
  CompletingFailed,              // claim retries exhausted
  AbortingFailed,                // abort retries exhausted
  ConversionFailed,              // detail not representable on the other chain
  StreamTerminated,              // a source failed and is no longer polled
  RefundedWhileCompleting        // source refunded after the secret was revealed
};

enum class Severity { Warning, Critical };

struct Warning {
  WarningKind kind{WarningKind::AlreadyPresent};
  Severity severity{Severity::Warning};
  BridgeTransferId bridge_transfer_id;
  std::string message;
  std::optional<ContractEvent> observed;  // the triggering event, if any
};

struct Event {
  EventOrigin origin{EventOrigin::B1I};
  EventKind kind{EventKind::Contract};
  int64_t timestamp{0};

  // Payload matching `kind`
  ContractEvent contract;
  ActiveSwapEvent progress;
  Warning warning;

  static Event Contract(EventOrigin origin, ContractEvent e);
  static Event Progress(EventOrigin origin, ActiveSwapEvent e);
  static Event Warn(EventOrigin origin, Warning w);

  bool IsWarning() const { return kind == EventKind::Warning; }
  bool IsCritical() const {
    return kind == EventKind::Warning && warning.severity == Severity::Critical;
  }

  std::string ToString() const;
};

std::string ToString(EventOrigin origin);
std::string ToString(EventKind kind);
std::string ToString(WarningKind kind);
std::string ToString(Severity severity);

} // namespace bridge
} // namespace swaprelay
