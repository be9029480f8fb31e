// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "bridge/bridge_service.hpp"
#include "util/logging.hpp"

namespace swaprelay {
namespace bridge {

namespace {

Warning MakeWarning(WarningKind kind, Severity severity, const BridgeTransferId& id,
                    std::string message) {
  Warning w;
  w.kind = kind;
  w.severity = severity;
  w.bridge_transfer_id = id;
  w.message = std::move(message);
  return w;
}

WarningKind WarningFor(ActiveSwapEventKind kind) {
  switch (kind) {
  case ActiveSwapEventKind::AssetsCompletingError:
    return WarningKind::CompletingFailed;
  case ActiveSwapEventKind::AssetsAbortingError:
    return WarningKind::AbortingFailed;
  case ActiveSwapEventKind::AssetsLockingError:
    return WarningKind::LockingFailed;
  case ActiveSwapEventKind::AssetsLocked:
  case ActiveSwapEventKind::AssetsCompleted:
  case ActiveSwapEventKind::AssetsAborted:
    break;
  }
  // Only error kinds are mapped
  return WarningKind::LockingFailed;
}

} // namespace

BridgeService::BridgeService(boost::asio::io_context& io_context,
                             std::shared_ptr<BlockchainService> chain1,
                             std::shared_ptr<BlockchainService> chain2,
                             std::shared_ptr<const ChainConverter> converter,
                             const ActiveSwapMap::Config& config)
    : chain1_{std::move(chain1), EventOrigin::B1I, EventOrigin::B1C},
      chain2_{std::move(chain2), EventOrigin::B2I, EventOrigin::B2C},
      b1_to_b2_(io_context, chain1_.service->name() + "->" + chain2_.service->name(),
                chain1_.service->initiator_contract(),
                chain2_.service->counterparty_contract(),
                DirectedConverter(converter, ChainSide::Chain2), config),
      b2_to_b1_(io_context, chain2_.service->name() + "->" + chain1_.service->name(),
                chain2_.service->initiator_contract(),
                chain1_.service->counterparty_contract(),
                DirectedConverter(converter, ChainSide::Chain1), config),
      b1_to_b2_direction_{b1_to_b2_, EventOrigin::B1I, EventOrigin::B2C},
      b2_to_b1_direction_{b2_to_b1_, EventOrigin::B2I, EventOrigin::B1C} {
  LOG_BRIDGE_INFO("BridgeService: relaying {} <-> {}", chain1_.service->name(),
                  chain2_.service->name());
}

void BridgeService::SetWaker(Waker waker) {
  b1_to_b2_.SetWaker(waker);
  b2_to_b1_.SetWaker(waker);
  chain1_.service->Events().SetWaker(waker);
  chain2_.service->Events().SetWaker(waker);
}

bool BridgeService::IsChainActive(ChainSide side) const {
  return side == ChainSide::Chain1 ? chain1_.active : chain2_.active;
}

StreamPoll<Event> BridgeService::PollNext() {
  if (auto event = PollTracker(b1_to_b2_direction_)) {
    return StreamPoll<Event>::Ready(std::move(*event));
  }
  if (auto event = PollTracker(b2_to_b1_direction_)) {
    return StreamPoll<Event>::Ready(std::move(*event));
  }
  if (auto event = PollChain(chain1_, b1_to_b2_direction_, b2_to_b1_direction_)) {
    return StreamPoll<Event>::Ready(std::move(*event));
  }
  if (auto event = PollChain(chain2_, b2_to_b1_direction_, b1_to_b2_direction_)) {
    return StreamPoll<Event>::Ready(std::move(*event));
  }
  return StreamPoll<Event>::Pending();
}

std::optional<Event> BridgeService::PollTracker(const Direction& direction) {
  auto poll = direction.tracker.PollNext();
  if (!poll.ready()) {
    return std::nullopt;
  }

  const ActiveSwapEvent& progress = *poll.item;
  const EventOrigin origin = progress.kind == ActiveSwapEventKind::AssetsCompleted ||
                                     progress.kind == ActiveSwapEventKind::AssetsCompletingError
                                 ? direction.source_initiator
                                 : direction.destination_counterparty;

  if (!progress.IsError()) {
    LOG_BRIDGE_DEBUG("BridgeService {}: {}", direction.tracker.name(), progress.ToString());
    return Event::Progress(origin, progress);
  }

  LOG_BRIDGE_ERROR("BridgeService {}: {}", direction.tracker.name(), progress.ToString());
  Warning w = MakeWarning(WarningFor(progress.kind), Severity::Critical,
                          progress.bridge_transfer_id,
                          direction.tracker.name() + ": " + progress.ToString());
  return Event::Warn(origin, std::move(w));
}

std::optional<Event> BridgeService::PollChain(ChainSource& source, const Direction& outgoing,
                                              const Direction& incoming) {
  if (!source.active) {
    return std::nullopt;
  }

  auto poll = source.service->Events().PollNext();
  switch (poll.status) {
  case PollStatus::Pending:
    return std::nullopt;

  case PollStatus::Ended:
    LOG_BRIDGE_WARN("BridgeService: {} event stream ended, no longer polled",
                    source.service->name());
    source.active = false;
    return std::nullopt;

  case PollStatus::Failed: {
    LOG_BRIDGE_CRITICAL("BridgeService: {} event stream failed: {}", source.service->name(),
                        poll.error);
    source.active = false;
    Warning w = MakeWarning(WarningKind::StreamTerminated, Severity::Critical, uint256{},
                            source.service->name() + " event stream terminated: " +
                                poll.error);
    return Event::Warn(source.initiator_origin, std::move(w));
  }

  case PollStatus::Ready:
    break;
  }

  const ContractEvent& event = *poll.item;
  LOG_BRIDGE_DEBUG("BridgeService: {} observed {}", source.service->name(), event.ToString());

  if (event.role == ContractRole::Initiator) {
    return HandleInitiatorEvent(event, source.initiator_origin, outgoing);
  }
  return HandleCounterpartyEvent(event, source.counterparty_origin, incoming);
}

Event BridgeService::HandleInitiatorEvent(const ContractEvent& event, EventOrigin origin,
                                          const Direction& outgoing) {
  ActiveSwapMap& tracker = outgoing.tracker;
  const InitiatorEvent& e = event.initiator;
  const BridgeTransferId& id = e.bridge_transfer_id();

  switch (e.kind) {
  case InitiatorEventKind::Initiated: {
    if (auto existing = tracker.GetSwap(id)) {
      const bool consistent = existing->details == e.details;
      Warning w = MakeWarning(
          WarningKind::AlreadyPresent, consistent ? Severity::Warning : Severity::Critical, id,
          consistent ? "transfer already in progress"
                     : "transfer already in progress with different details");
      w.observed = event;
      if (consistent) {
        LOG_BRIDGE_WARN("BridgeService {}: duplicate Initiated for {}", tracker.name(),
                        id.GetHex());
      } else {
        LOG_BRIDGE_CRITICAL("BridgeService {}: Initiated for {} conflicts with tracked swap",
                            tracker.name(), id.GetHex());
      }
      return Event::Warn(origin, std::move(w));
    }

    ActiveSwapResult result = tracker.StartBridgeTransfer(e.details);
    if (result == ActiveSwapResult::ConversionFailed) {
      Warning w = MakeWarning(WarningKind::ConversionFailed, Severity::Critical, id,
                              "initiation details have no representation on the "
                              "destination chain");
      w.observed = event;
      return Event::Warn(origin, std::move(w));
    }
    if (result == ActiveSwapResult::AlreadyPresent) {
      Warning w = MakeWarning(WarningKind::AlreadyPresent, Severity::Warning, id,
                              "transfer already in progress");
      w.observed = event;
      return Event::Warn(origin, std::move(w));
    }
    return Event::Contract(origin, event);
  }

  case InitiatorEventKind::Completed:
    LOG_BRIDGE_INFO("BridgeService {}: claim for {} confirmed on source", tracker.name(),
                    id.GetHex());
    return Event::Contract(origin, event);

  case InitiatorEventKind::Refunded: {
    ActiveSwapResult result = tracker.AbortBridgeTransfer(id);
    if (result == ActiveSwapResult::AlreadyCompleting) {
      LOG_BRIDGE_CRITICAL("BridgeService {}: {} refunded on source after the secret was "
                          "revealed on destination",
                          tracker.name(), id.GetHex());
      Warning w = MakeWarning(WarningKind::RefundedWhileCompleting, Severity::Critical, id,
                              "transfer refunded on source while its claim is in flight");
      w.observed = event;
      return Event::Warn(origin, std::move(w));
    }
    if (result == ActiveSwapResult::Ok) {
      LOG_BRIDGE_INFO("BridgeService {}: {} refunded, destination lock aborted",
                      tracker.name(), id.GetHex());
    }
    return Event::Contract(origin, event);
  }
  }

  return Event::Contract(origin, event);
}

Event BridgeService::HandleCounterpartyEvent(const ContractEvent& event, EventOrigin origin,
                                             const Direction& incoming) {
  ActiveSwapMap& tracker = incoming.tracker;
  const CounterpartyEvent& e = event.counterparty;
  const BridgeTransferId& id = e.bridge_transfer_id();

  if (e.kind == CounterpartyEventKind::Locked) {
    return Event::Contract(origin, event);
  }

  ActiveSwapResult result = tracker.CompleteBridgeTransfer(e.completed);
  if (result == ActiveSwapResult::NonExistingSwap) {
    LOG_BRIDGE_CRITICAL("BridgeService {}: Completed for unknown transfer {}", tracker.name(),
                        id.GetHex());
    Warning w = MakeWarning(WarningKind::CannotCompleteUnexistingSwap, Severity::Critical, id,
                            "secret revealed for a transfer that is not tracked");
    w.observed = event;
    return Event::Warn(origin, std::move(w));
  }
  return Event::Contract(origin, event);
}

} // namespace bridge
} // namespace swaprelay
