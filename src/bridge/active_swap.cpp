// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "bridge/active_swap.hpp"
#include "util/logging.hpp"
#include <boost/asio/post.hpp>

namespace swaprelay {
namespace bridge {

bool ActiveSwapEvent::IsError() const {
  return kind == ActiveSwapEventKind::AssetsLockingError ||
         kind == ActiveSwapEventKind::AssetsCompletingError ||
         kind == ActiveSwapEventKind::AssetsAbortingError;
}

std::string ActiveSwapEvent::ToString() const {
  std::string s = bridge::ToString(kind) + "(" + bridge_transfer_id.GetHex() + ")";
  if (IsError()) {
    s += " after " + std::to_string(attempts) + " attempt(s): " + error;
  }
  return s;
}

std::string ToString(SwapStatus status) {
  switch (status) {
  case SwapStatus::Locking:
    return "Locking";
  case SwapStatus::Locked:
    return "Locked";
  case SwapStatus::Completing:
    return "Completing";
  case SwapStatus::CompletedPendingRemoval:
    return "CompletedPendingRemoval";
  }
  return "Unknown";
}

std::string ToString(ActiveSwapEventKind kind) {
  switch (kind) {
  case ActiveSwapEventKind::AssetsLocked:
    return "AssetsLocked";
  case ActiveSwapEventKind::AssetsLockingError:
    return "AssetsLockingError";
  case ActiveSwapEventKind::AssetsCompleted:
    return "AssetsCompleted";
  case ActiveSwapEventKind::AssetsCompletingError:
    return "AssetsCompletingError";
  case ActiveSwapEventKind::AssetsAborted:
    return "AssetsAborted";
  case ActiveSwapEventKind::AssetsAbortingError:
    return "AssetsAbortingError";
  }
  return "Unknown";
}

std::string ToString(ActiveSwapResult result) {
  switch (result) {
  case ActiveSwapResult::Ok:
    return "Ok";
  case ActiveSwapResult::AlreadyPresent:
    return "AlreadyPresent";
  case ActiveSwapResult::NonExistingSwap:
    return "NonExistingSwap";
  case ActiveSwapResult::AlreadyCompleting:
    return "AlreadyCompleting";
  case ActiveSwapResult::ConversionFailed:
    return "ConversionFailed";
  }
  return "Unknown";
}

ActiveSwapMap::ActiveSwapMap(boost::asio::io_context& io_context, std::string name,
                             InitiatorContract& source_initiator,
                             CounterpartyContract& destination_counterparty,
                             DirectedConverter converter, const Config& config)
    : io_context_(io_context),
      name_(std::move(name)),
      source_initiator_(source_initiator),
      destination_counterparty_(destination_counterparty),
      converter_(std::move(converter)),
      config_(Normalize(config)),
      lifetime_token_(std::make_shared<int>(0)) {}

ActiveSwapMap::~ActiveSwapMap() {
  lifetime_token_.reset();
  for (auto& [id, timer] : retry_timers_) {
    timer->cancel();
  }
  retry_timers_.clear();
}

bool ActiveSwapMap::AlreadyExecuting(const BridgeTransferId& id) const {
  return swaps_.Contains(id);
}

std::optional<ActiveSwap> ActiveSwapMap::GetSwap(const BridgeTransferId& id) const {
  return swaps_.Get(id);
}

ActiveSwapResult ActiveSwapMap::StartBridgeTransfer(const BridgeTransferDetails& details) {
  const BridgeTransferId& id = details.bridge_transfer_id;

  if (swaps_.Contains(id)) {
    return ActiveSwapResult::AlreadyPresent;
  }

  auto lock = converter_.ToLockDetails(details);
  if (!lock) {
    LOG_SWAP_ERROR("ActiveSwapMap {}: transfer {} has no destination representation "
                   "(initiator={}, recipient={})",
                   name_, id.GetHex(), details.initiator_address.ToString(),
                   details.recipient_address.ToString());
    return ActiveSwapResult::ConversionFailed;
  }

  ActiveSwap swap;
  swap.details = details;
  swap.lock = *lock;
  swap.status = SwapStatus::Locking;
  if (!swaps_.TryInsert(id, swap)) {
    return ActiveSwapResult::AlreadyPresent;
  }

  LOG_SWAP_INFO("ActiveSwapMap {}: tracking transfer {} (amount={}), locking on destination",
                name_, id.GetHex(), details.amount);

  PendingCall call{CallKind::Lock, id, *lock, HashLockPreImage{}, 0};
  Dispatch(std::move(call));
  return ActiveSwapResult::Ok;
}

ActiveSwapResult ActiveSwapMap::CompleteBridgeTransfer(const CompletedDetails& details) {
  const BridgeTransferId& id = details.bridge_transfer_id;

  ActiveSwapResult result = ActiveSwapResult::NonExistingSwap;
  LockDetails lock;
  swaps_.Modify(id, [&](ActiveSwap& swap) {
    if (swap.status == SwapStatus::Completing ||
        swap.status == SwapStatus::CompletedPendingRemoval) {
      result = ActiveSwapResult::AlreadyCompleting;
      return;
    }
    swap.status = SwapStatus::Completing;
    lock = swap.lock;
    result = ActiveSwapResult::Ok;
  });

  if (result != ActiveSwapResult::Ok) {
    LOG_SWAP_DEBUG("ActiveSwapMap {}: complete {} -> {}", name_, id.GetHex(),
                   ToString(result));
    return result;
  }

  LOG_SWAP_INFO("ActiveSwapMap {}: secret revealed for {}, claiming on source", name_,
                id.GetHex());
  PendingCall call{CallKind::Complete, id, lock, details.secret, 0};
  Dispatch(std::move(call));
  return ActiveSwapResult::Ok;
}

ActiveSwapResult ActiveSwapMap::AbortBridgeTransfer(const BridgeTransferId& id) {
  auto swap = swaps_.Get(id);
  if (!swap) {
    return ActiveSwapResult::NonExistingSwap;
  }
  if (swap->status == SwapStatus::Completing ||
      swap->status == SwapStatus::CompletedPendingRemoval) {
    // The destination lock was already claimed; nothing left to abort
    LOG_SWAP_ERROR("ActiveSwapMap {}: transfer {} refunded on source while {}", name_,
                   id.GetHex(), ToString(swap->status));
    return ActiveSwapResult::AlreadyCompleting;
  }
  swaps_.Erase(id);

  LOG_SWAP_INFO("ActiveSwapMap {}: transfer {} refunded on source (was {}), aborting lock",
                name_, id.GetHex(), ToString(swap->status));
  PendingCall call{CallKind::Abort, id, swap->lock, HashLockPreImage{}, 0};
  Dispatch(std::move(call));
  return ActiveSwapResult::Ok;
}

StreamPoll<ActiveSwapEvent> ActiveSwapMap::PollNext() {
  auto poll = progress_.PollNext();
  if (poll.ready() && poll.item->kind == ActiveSwapEventKind::AssetsCompleted) {
    if (swaps_.EraseIf(poll.item->bridge_transfer_id, [](const ActiveSwap& swap) {
          return swap.status == SwapStatus::CompletedPendingRemoval;
        })) {
      LOG_SWAP_DEBUG("ActiveSwapMap {}: transfer {} removed ({} active)", name_,
                     poll.item->bridge_transfer_id.GetHex(), swaps_.Size());
    }
  }
  return poll;
}

void ActiveSwapMap::SetWaker(Waker waker) {
  progress_.SetWaker(std::move(waker));
}

ActiveSwapMap::Config ActiveSwapMap::Normalize(Config config) {
  if (config.max_attempts == 0) {
    LOG_SWAP_WARN("ActiveSwapMap: max_attempts=0 treated as 1");
    config.max_attempts = 1;
  }
  return config;
}

const char* ActiveSwapMap::CallName(CallKind kind) {
  switch (kind) {
  case CallKind::Lock:
    return "lock";
  case CallKind::Complete:
    return "complete";
  case CallKind::Abort:
    return "abort";
  }
  return "unknown";
}

void ActiveSwapMap::Dispatch(PendingCall call) {
  // A lock retry for a swap that was refunded (or refunded and initiated
  // again with other details) meanwhile is moot
  if (call.kind == CallKind::Lock && call.attempt > 0) {
    bool current = false;
    swaps_.Read(call.id, [&](const ActiveSwap& swap) { current = swap.lock == call.lock; });
    if (!current) {
      LOG_SWAP_DEBUG("ActiveSwapMap {}: dropping stale lock retry for {}", name_,
                     call.id.GetHex());
      return;
    }
  }

  ++call.attempt;
  LOG_SWAP_TRACE("ActiveSwapMap {}: {} call for {} (attempt {}/{})", name_,
                 CallName(call.kind), call.id.GetHex(), call.attempt, config_.max_attempts);

  std::weak_ptr<int> guard = lifetime_token_;
  ContractCallHandler handler = [this, guard, call](const ContractCallResult& result) {
    if (guard.expired()) {
      return;
    }
    boost::asio::post(io_context_, [this, guard, call, result]() {
      if (guard.expired()) {
        return;
      }
      HandleCallResult(call, result);
    });
  };

  switch (call.kind) {
  case CallKind::Lock:
    destination_counterparty_.LockBridgeTransfer(call.lock, std::move(handler));
    break;
  case CallKind::Complete:
    source_initiator_.CompleteBridgeTransfer(call.id, call.secret, std::move(handler));
    break;
  case CallKind::Abort:
    destination_counterparty_.AbortBridgeTransfer(call.id, std::move(handler));
    break;
  }
}

void ActiveSwapMap::HandleCallResult(const PendingCall& call, const ContractCallResult& result) {
  if (result.ok) {
    HandleCallSucceeded(call);
    return;
  }

  if (call.attempt < config_.max_attempts) {
    LOG_SWAP_WARN("ActiveSwapMap {}: {} call for {} failed (attempt {}/{}): {}, retrying",
                  name_, CallName(call.kind), call.id.GetHex(), call.attempt,
                  config_.max_attempts, result.error);
    ScheduleRetry(call);
    return;
  }

  HandleCallExhausted(call, result.error);
}

void ActiveSwapMap::HandleCallSucceeded(const PendingCall& call) {
  switch (call.kind) {
  case CallKind::Lock:
    swaps_.Modify(call.id, [](ActiveSwap& swap) {
      if (swap.status == SwapStatus::Locking) {
        swap.status = SwapStatus::Locked;
      }
    });
    Emit(ActiveSwapEventKind::AssetsLocked, call);
    break;
  case CallKind::Complete:
    swaps_.Modify(call.id, [](ActiveSwap& swap) {
      swap.status = SwapStatus::CompletedPendingRemoval;
    });
    Emit(ActiveSwapEventKind::AssetsCompleted, call);
    break;
  case CallKind::Abort:
    Emit(ActiveSwapEventKind::AssetsAborted, call);
    break;
  }
}

void ActiveSwapMap::HandleCallExhausted(const PendingCall& call, const std::string& error) {
  LOG_SWAP_ERROR("ActiveSwapMap {}: {} call for {} failed after {} attempt(s): {}", name_,
                 CallName(call.kind), call.id.GetHex(), call.attempt, error);

  switch (call.kind) {
  case CallKind::Lock:
    Emit(ActiveSwapEventKind::AssetsLockingError, call, error);
    break;
  case CallKind::Complete:
    // Back to Locked so a re-observed completion can claim again
    swaps_.Modify(call.id, [](ActiveSwap& swap) {
      if (swap.status == SwapStatus::Completing) {
        swap.status = SwapStatus::Locked;
      }
    });
    Emit(ActiveSwapEventKind::AssetsCompletingError, call, error);
    break;
  case CallKind::Abort:
    Emit(ActiveSwapEventKind::AssetsAbortingError, call, error);
    break;
  }
}

void ActiveSwapMap::ScheduleRetry(PendingCall call) {
  std::weak_ptr<int> guard = lifetime_token_;

  if (config_.retry_delay.count() <= 0) {
    boost::asio::post(io_context_, [this, guard, call]() {
      if (!guard.expired()) {
        Dispatch(call);
      }
    });
    return;
  }

  const uint64_t timer_id = next_timer_id_++;
  auto timer = std::make_unique<boost::asio::steady_timer>(io_context_);
  timer->expires_after(config_.retry_delay);
  timer->async_wait([this, guard, timer_id, call](const boost::system::error_code& ec) {
    if (ec == boost::asio::error::operation_aborted || guard.expired()) {
      return;
    }
    retry_timers_.erase(timer_id);
    Dispatch(call);
  });
  retry_timers_.emplace(timer_id, std::move(timer));
}

void ActiveSwapMap::Emit(ActiveSwapEventKind kind, const PendingCall& call,
                         const std::string& error) {
  ActiveSwapEvent event;
  event.kind = kind;
  event.bridge_transfer_id = call.id;
  event.error = error;
  event.attempts = call.attempt;
  progress_.Push(std::move(event));
}

} // namespace bridge
} // namespace swaprelay
