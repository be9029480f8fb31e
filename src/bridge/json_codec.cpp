// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "bridge/json_codec.hpp"
#include "util/string_parsing.hpp"
#include "util/time.hpp"

namespace swaprelay {
namespace bridge {

using json = nlohmann::json;

namespace {

json AddressFields(const BridgeAddress& initiator, const BridgeAddress& recipient) {
  json j;
  j["initiator_address"] = initiator.ToString();
  j["recipient_address"] = recipient.ToString();
  return j;
}

json TransferToJson(const BridgeTransferDetails& d) {
  json j = AddressFields(d.initiator_address, d.recipient_address);
  j["bridge_transfer_id"] = d.bridge_transfer_id.GetHex();
  j["hash_lock"] = d.hash_lock.GetHex();
  j["time_lock"] = d.time_lock;
  j["amount"] = d.amount;
  return j;
}

json LockToJson(const LockDetails& d) {
  json j = AddressFields(d.initiator_address, d.recipient_address);
  j["bridge_transfer_id"] = d.bridge_transfer_id.GetHex();
  j["hash_lock"] = d.hash_lock.GetHex();
  j["time_lock"] = d.time_lock;
  j["amount"] = d.amount;
  return j;
}

json CompletedToJson(const CompletedDetails& d) {
  json j = AddressFields(d.initiator_address, d.recipient_address);
  j["bridge_transfer_id"] = d.bridge_transfer_id.GetHex();
  j["hash_lock"] = d.hash_lock.GetHex();
  j["secret"] = d.secret.GetHex();
  j["amount"] = d.amount;
  return j;
}

bool ReadHash(const json& j, const char* field, uint256& out, std::string& error) {
  if (!j.contains(field) || !j[field].is_string()) {
    error = std::string("missing or non-string field '") + field + "'";
    return false;
  }
  auto hash = util::SafeParseHash(j[field].get<std::string>());
  if (!hash) {
    error = std::string("field '") + field + "' is not a 32-byte hex string";
    return false;
  }
  out = *hash;
  return true;
}

bool ReadAddress(const json& j, const char* field, BridgeAddress& out, std::string& error) {
  if (!j.contains(field) || !j[field].is_string()) {
    error = std::string("missing or non-string field '") + field + "'";
    return false;
  }
  auto bytes = util::ParseHex(j[field].get<std::string>());
  if (!bytes || bytes->empty()) {
    error = std::string("field '") + field + "' is not a hex address";
    return false;
  }
  out = BridgeAddress(std::move(*bytes));
  return true;
}

bool ReadUint(const json& j, const char* field, uint64_t& out, std::string& error) {
  if (!j.contains(field) || !j[field].is_number_integer() ||
      (!j[field].is_number_unsigned() && j[field].get<int64_t>() < 0)) {
    error = std::string("missing or negative field '") + field + "'";
    return false;
  }
  out = j[field].get<uint64_t>();
  return true;
}

bool ReadTransfer(const json& j, BridgeTransferDetails& d, std::string& error) {
  return ReadHash(j, "bridge_transfer_id", d.bridge_transfer_id, error) &&
         ReadAddress(j, "initiator_address", d.initiator_address, error) &&
         ReadAddress(j, "recipient_address", d.recipient_address, error) &&
         ReadHash(j, "hash_lock", d.hash_lock, error) &&
         ReadUint(j, "time_lock", d.time_lock, error) &&
         ReadUint(j, "amount", d.amount, error);
}

bool ReadLock(const json& j, LockDetails& d, std::string& error) {
  return ReadHash(j, "bridge_transfer_id", d.bridge_transfer_id, error) &&
         ReadAddress(j, "initiator_address", d.initiator_address, error) &&
         ReadAddress(j, "recipient_address", d.recipient_address, error) &&
         ReadHash(j, "hash_lock", d.hash_lock, error) &&
         ReadUint(j, "time_lock", d.time_lock, error) &&
         ReadUint(j, "amount", d.amount, error);
}

bool ReadCompleted(const json& j, CompletedDetails& d, std::string& error) {
  return ReadHash(j, "bridge_transfer_id", d.bridge_transfer_id, error) &&
         ReadAddress(j, "initiator_address", d.initiator_address, error) &&
         ReadAddress(j, "recipient_address", d.recipient_address, error) &&
         ReadHash(j, "hash_lock", d.hash_lock, error) &&
         ReadHash(j, "secret", d.secret, error) &&
         ReadUint(j, "amount", d.amount, error);
}

} // namespace

json ContractEventToJson(const ContractEvent& event) {
  json j;
  if (event.role == ContractRole::Initiator) {
    const InitiatorEvent& e = event.initiator;
    j = e.kind == InitiatorEventKind::Completed ? CompletedToJson(e.completed)
                                                : TransferToJson(e.details);
    j["event"] = ToString(e.kind);
  } else {
    const CounterpartyEvent& e = event.counterparty;
    j = e.kind == CounterpartyEventKind::Locked ? LockToJson(e.locked)
                                                : CompletedToJson(e.completed);
    j["event"] = ToString(e.kind);
  }
  j["contract"] = ToString(event.role);
  return j;
}

std::optional<ContractEvent> ContractEventFromJson(const json& j, std::string& error) {
  if (!j.is_object()) {
    error = "event is not a JSON object";
    return std::nullopt;
  }
  if (!j.contains("contract") || !j["contract"].is_string() ||
      !j.contains("event") || !j["event"].is_string()) {
    error = "missing 'contract' or 'event'";
    return std::nullopt;
  }

  const std::string contract = j["contract"].get<std::string>();
  const std::string name = j["event"].get<std::string>();

  if (contract == "initiator") {
    if (name == "Initiated" || name == "Refunded") {
      BridgeTransferDetails d;
      if (!ReadTransfer(j, d, error)) return std::nullopt;
      return ContractEvent::FromInitiator(name == "Initiated" ? InitiatorEvent::Initiated(d)
                                                              : InitiatorEvent::Refunded(d));
    }
    if (name == "Completed") {
      CompletedDetails d;
      if (!ReadCompleted(j, d, error)) return std::nullopt;
      return ContractEvent::FromInitiator(InitiatorEvent::Completed(d));
    }
  } else if (contract == "counterparty") {
    if (name == "Locked") {
      LockDetails d;
      if (!ReadLock(j, d, error)) return std::nullopt;
      return ContractEvent::FromCounterparty(CounterpartyEvent::Locked(d));
    }
    if (name == "Completed") {
      CompletedDetails d;
      if (!ReadCompleted(j, d, error)) return std::nullopt;
      return ContractEvent::FromCounterparty(CounterpartyEvent::Completed(d));
    }
  } else {
    error = "unknown contract '" + contract + "'";
    return std::nullopt;
  }

  error = "unknown " + contract + " event '" + name + "'";
  return std::nullopt;
}

std::optional<ContractEvent> ParseContractEventLine(const std::string& line, std::string& error) {
  json j;
  try {
    j = json::parse(line);
  } catch (const json::parse_error& e) {
    error = std::string("invalid JSON: ") + e.what();
    return std::nullopt;
  }
  return ContractEventFromJson(j, error);
}

json EventToJson(const Event& event) {
  json j;
  j["timestamp"] = event.timestamp;
  j["time"] = util::FormatTime(event.timestamp);
  j["origin"] = ToString(event.origin);
  j["kind"] = ToString(event.kind);

  switch (event.kind) {
  case EventKind::Contract:
    j["event"] = ContractEventToJson(event.contract);
    break;
  case EventKind::Progress: {
    json p;
    p["status"] = ToString(event.progress.kind);
    p["bridge_transfer_id"] = event.progress.bridge_transfer_id.GetHex();
    p["attempts"] = event.progress.attempts;
    if (event.progress.IsError()) {
      p["error"] = event.progress.error;
    }
    j["progress"] = p;
    break;
  }
  case EventKind::Warning: {
    json w;
    w["warning"] = ToString(event.warning.kind);
    w["severity"] = ToString(event.warning.severity);
    w["bridge_transfer_id"] = event.warning.bridge_transfer_id.GetHex();
    w["message"] = event.warning.message;
    if (event.warning.observed) {
      w["observed"] = ContractEventToJson(*event.warning.observed);
    }
    j["warning"] = w;
    break;
  }
  }
  return j;
}

std::string DumpJsonLine(const json& j) {
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace bridge
} // namespace swaprelay
