// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "bridge/contract_events.hpp"
#include "bridge/events.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace swaprelay {
namespace bridge {

/**
 * JSON representation of bridge data
 *
 * Contract event (one object per journal line):
 *   {
 *     "contract": "initiator" | "counterparty",
 *     "event": "Initiated" | "Completed" | "Refunded" | "Locked",
 *     "bridge_transfer_id": "<64 hex>",
 *     "initiator_address": "0x<hex>",
 *     "recipient_address": "0x<hex>",
 *     "hash_lock": "<64 hex>",
 *     "time_lock": <uint>,        (not on Completed)
 *     "secret": "<64 hex>",       (Completed only)
 *     "amount": <uint>
 *   }
 *
 * Hashes accept an optional "0x" prefix on input and are written without it.
 */

nlohmann::json ContractEventToJson(const ContractEvent& event);

// Returns std::nullopt and fills `error` on any schema violation
std::optional<ContractEvent> ContractEventFromJson(const nlohmann::json& j, std::string& error);

// Parses one text line; malformed JSON is reported through `error`
std::optional<ContractEvent> ParseContractEventLine(const std::string& line, std::string& error);

// Structured, timestamped rendering of a unified event for alerting
nlohmann::json EventToJson(const Event& event);

// Compact single-line dump for the JSON-lines journals. Invalid UTF-8 (raw
// bytes echoed from a malformed input line, a chain name) is replaced with
// U+FFFD instead of throwing.
std::string DumpJsonLine(const nlohmann::json& j);

} // namespace bridge
} // namespace swaprelay
