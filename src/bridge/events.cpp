// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "bridge/events.hpp"
#include "util/time.hpp"

namespace swaprelay {
namespace bridge {

Event Event::Contract(EventOrigin origin, ContractEvent e) {
  Event ev;
  ev.origin = origin;
  ev.kind = EventKind::Contract;
  ev.timestamp = util::GetTime();
  ev.contract = std::move(e);
  return ev;
}

Event Event::Progress(EventOrigin origin, ActiveSwapEvent e) {
  Event ev;
  ev.origin = origin;
  ev.kind = EventKind::Progress;
  ev.timestamp = util::GetTime();
  ev.progress = std::move(e);
  return ev;
}

Event Event::Warn(EventOrigin origin, Warning w) {
  Event ev;
  ev.origin = origin;
  ev.kind = EventKind::Warning;
  ev.timestamp = util::GetTime();
  ev.warning = std::move(w);
  return ev;
}

std::string Event::ToString() const {
  std::string s = "[" + bridge::ToString(origin) + "] ";
  switch (kind) {
  case EventKind::Contract:
    return s + contract.ToString();
  case EventKind::Progress:
    return s + progress.ToString();
  case EventKind::Warning:
    return s + bridge::ToString(warning.severity) + " " + bridge::ToString(warning.kind) +
           "(" + warning.bridge_transfer_id.GetHex() + ")" +
           (warning.message.empty() ? "" : ": " + warning.message);
  }
  return s;
}

std::string ToString(EventOrigin origin) {
  switch (origin) {
  case EventOrigin::B1I:
    return "B1I";
  case EventOrigin::B1C:
    return "B1C";
  case EventOrigin::B2I:
    return "B2I";
  case EventOrigin::B2C:
    return "B2C";
  }
  return "Unknown";
}

std::string ToString(EventKind kind) {
  switch (kind) {
  case EventKind::Contract:
    return "contract";
  case EventKind::Progress:
    return "progress";
  case EventKind::Warning:
    return "warning";
  }
  return "unknown";
}

std::string ToString(WarningKind kind) {
  switch (kind) {
  case WarningKind::AlreadyPresent:
    return "AlreadyPresent";
  case WarningKind::CannotCompleteUnexistingSwap:
    return "CannotCompleteUnexistingSwap";
  case WarningKind::LockingFailed:
    return "LockingFailed";
  case WarningKind::CompletingFailed:
    return "CompletingFailed";
  case WarningKind::AbortingFailed:
    return "AbortingFailed";
  case WarningKind::ConversionFailed:
    return "ConversionFailed";
  case WarningKind::StreamTerminated:
    return "StreamTerminated";
  case WarningKind::RefundedWhileCompleting:
    return "RefundedWhileCompleting";
  }
  return "Unknown";
}

std::string ToString(Severity severity) {
  return severity == Severity::Critical ? "critical" : "warning";
}

} // namespace bridge
} // namespace swaprelay
