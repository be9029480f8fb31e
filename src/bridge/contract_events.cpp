// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "bridge/contract_events.hpp"

namespace swaprelay {
namespace bridge {

InitiatorEvent InitiatorEvent::Initiated(BridgeTransferDetails d) {
  InitiatorEvent e;
  e.kind = InitiatorEventKind::Initiated;
  e.details = std::move(d);
  return e;
}

InitiatorEvent InitiatorEvent::Completed(CompletedDetails d) {
  InitiatorEvent e;
  e.kind = InitiatorEventKind::Completed;
  e.completed = std::move(d);
  return e;
}

InitiatorEvent InitiatorEvent::Refunded(BridgeTransferDetails d) {
  InitiatorEvent e;
  e.kind = InitiatorEventKind::Refunded;
  e.details = std::move(d);
  return e;
}

const BridgeTransferId& InitiatorEvent::bridge_transfer_id() const {
  return kind == InitiatorEventKind::Completed ? completed.bridge_transfer_id
                                               : details.bridge_transfer_id;
}

CounterpartyEvent CounterpartyEvent::Locked(LockDetails d) {
  CounterpartyEvent e;
  e.kind = CounterpartyEventKind::Locked;
  e.locked = std::move(d);
  return e;
}

CounterpartyEvent CounterpartyEvent::Completed(CompletedDetails d) {
  CounterpartyEvent e;
  e.kind = CounterpartyEventKind::Completed;
  e.completed = std::move(d);
  return e;
}

const BridgeTransferId& CounterpartyEvent::bridge_transfer_id() const {
  return kind == CounterpartyEventKind::Locked ? locked.bridge_transfer_id
                                               : completed.bridge_transfer_id;
}

ContractEvent ContractEvent::FromInitiator(InitiatorEvent e) {
  ContractEvent c;
  c.role = ContractRole::Initiator;
  c.initiator = std::move(e);
  return c;
}

ContractEvent ContractEvent::FromCounterparty(CounterpartyEvent e) {
  ContractEvent c;
  c.role = ContractRole::Counterparty;
  c.counterparty = std::move(e);
  return c;
}

const BridgeTransferId& ContractEvent::bridge_transfer_id() const {
  return role == ContractRole::Initiator ? initiator.bridge_transfer_id()
                                         : counterparty.bridge_transfer_id();
}

std::string ContractEvent::ToString() const {
  std::string kind = role == ContractRole::Initiator
                         ? bridge::ToString(initiator.kind)
                         : bridge::ToString(counterparty.kind);
  return bridge::ToString(role) + "." + kind + "(" +
         bridge_transfer_id().GetHex() + ")";
}

std::string ToString(InitiatorEventKind kind) {
  switch (kind) {
  case InitiatorEventKind::Initiated:
    return "Initiated";
  case InitiatorEventKind::Completed:
    return "Completed";
  case InitiatorEventKind::Refunded:
    return "Refunded";
  }
  return "Unknown";
}

std::string ToString(CounterpartyEventKind kind) {
  switch (kind) {
  case CounterpartyEventKind::Locked:
    return "Locked";
  case CounterpartyEventKind::Completed:
    return "Completed";
  }
  return "Unknown";
}

std::string ToString(ContractRole role) {
  return role == ContractRole::Initiator ? "initiator" : "counterparty";
}

} // namespace bridge
} // namespace swaprelay
