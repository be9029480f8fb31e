// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#ifndef SWAPRELAY_BRIDGE_ACTIVE_SWAP_HPP
#define SWAPRELAY_BRIDGE_ACTIVE_SWAP_HPP

#include "bridge/blockchain_service.hpp"
#include "bridge/conversion.hpp"
#include "bridge/event_stream.hpp"
#include "bridge/types.hpp"
#include "util/threadsafe_containers.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace swaprelay {
namespace bridge {

enum class SwapStatus {
  Locking,                 // lock call dispatched on the destination chain
  Locked,                  // lock call succeeded
  Completing,              // claim call dispatched on the source chain
  CompletedPendingRemoval  // claim succeeded, removed once reported
};

struct ActiveSwap {
  BridgeTransferDetails details;  // as observed on the source chain
  LockDetails lock;               // destination-chain representation
  SwapStatus status{SwapStatus::Locking};
};

enum class ActiveSwapEventKind {
  AssetsLocked,
  AssetsLockingError,
  AssetsCompleted,
  AssetsCompletingError,
  AssetsAborted,
  AssetsAbortingError
};

// Outcome of a contract call dispatched by a tracker
struct ActiveSwapEvent {
  ActiveSwapEventKind kind{ActiveSwapEventKind::AssetsLocked};
  BridgeTransferId bridge_transfer_id;
  std::string error;    // *Error kinds: last adapter error
  size_t attempts{0};   // number of calls made

  bool IsError() const;
  std::string ToString() const;
};

enum class ActiveSwapResult {
  Ok,
  AlreadyPresent,     // StartBridgeTransfer on a tracked id
  NonExistingSwap,    // Complete/Abort on an untracked id
  AlreadyCompleting,  // claim already in flight or done (complete and abort)
  ConversionFailed    // detail has no destination-chain representation
};

std::string ToString(SwapStatus status);
std::string ToString(ActiveSwapEventKind kind);
std::string ToString(ActiveSwapResult result);

/**
 * ActiveSwapMap - registry and call dispatcher for one relay direction
 *
 * A direction is "source chain initiates -> destination chain fulfils".
 * The tracker exclusively owns the registry of swaps it is relaying, and is
 * the only component that calls the two contracts of its direction:
 * - destination counterparty: lock (on start), abort (on source refund)
 * - source initiator: complete (once the secret is revealed)
 *
 * Calls are fire-and-forget for the caller; their outcomes come back through
 * this object's own EventStream. Failed calls are re-dispatched after
 * Config::retry_delay until Config::max_attempts calls have been made, then
 * reported as an *Error event.
 *
 * Threading: public methods and PollNext() run on the io_context thread.
 * Contract handlers may fire on any thread; they are posted back to the
 * io_context before touching tracker state.
 *
 * Lifetime: the contracts must outlive the tracker. Handlers delivered after
 * the tracker is destroyed are ignored.
 */
class ActiveSwapMap : public EventStream<ActiveSwapEvent> {
public:
  struct Config {
    size_t max_attempts;                    // total calls per operation, >= 1
    std::chrono::milliseconds retry_delay;  // wait between attempts

    Config() : max_attempts(5), retry_delay(std::chrono::milliseconds(2000)) {}
  };

  ActiveSwapMap(boost::asio::io_context& io_context, std::string name,
                InitiatorContract& source_initiator,
                CounterpartyContract& destination_counterparty,
                DirectedConverter converter, const Config& config = Config{});
  ~ActiveSwapMap() override;

  ActiveSwapMap(const ActiveSwapMap&) = delete;
  ActiveSwapMap& operator=(const ActiveSwapMap&) = delete;

  bool AlreadyExecuting(const BridgeTransferId& id) const;

  // Register the swap and dispatch the destination lock
  ActiveSwapResult StartBridgeTransfer(const BridgeTransferDetails& details);

  // Dispatch the source claim with the revealed secret
  ActiveSwapResult CompleteBridgeTransfer(const CompletedDetails& details);

  // Forget the swap and release the destination lock. A swap whose claim is
  // in flight or done is kept and AlreadyCompleting returned, no call made.
  ActiveSwapResult AbortBridgeTransfer(const BridgeTransferId& id);

  std::optional<ActiveSwap> GetSwap(const BridgeTransferId& id) const;
  size_t Size() const { return swaps_.Size(); }
  std::vector<BridgeTransferId> ActiveIds() const { return swaps_.GetKeys(); }

  const std::string& name() const { return name_; }
  const Config& config() const { return config_; }

  // Progress stream; drops a completed swap from the registry as its
  // AssetsCompleted event is handed out
  StreamPoll<ActiveSwapEvent> PollNext() override;
  void SetWaker(Waker waker) override;

private:
  enum class CallKind { Lock, Complete, Abort };

  struct PendingCall {
    CallKind kind;
    BridgeTransferId id;
    LockDetails lock;
    HashLockPreImage secret;
    size_t attempt{0};
  };

  void Dispatch(PendingCall call);
  void HandleCallResult(const PendingCall& call, const ContractCallResult& result);
  void HandleCallSucceeded(const PendingCall& call);
  void HandleCallExhausted(const PendingCall& call, const std::string& error);
  void ScheduleRetry(PendingCall call);
  void Emit(ActiveSwapEventKind kind, const PendingCall& call, const std::string& error = "");

  static const char* CallName(CallKind kind);
  static Config Normalize(Config config);

  boost::asio::io_context& io_context_;
  const std::string name_;
  InitiatorContract& source_initiator_;
  CounterpartyContract& destination_counterparty_;
  const DirectedConverter converter_;
  const Config config_;

  util::ThreadSafeMap<BridgeTransferId, ActiveSwap, std::map> swaps_;
  QueuedEventStream<ActiveSwapEvent> progress_;

  // Retry timers (io_context thread only)
  std::map<uint64_t, std::unique_ptr<boost::asio::steady_timer>> retry_timers_;
  uint64_t next_timer_id_{1};

  // Expires with the tracker so late handlers can detect destruction
  std::shared_ptr<int> lifetime_token_;
};

} // namespace bridge
} // namespace swaprelay

#endif // SWAPRELAY_BRIDGE_ACTIVE_SWAP_HPP
