// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#ifndef SWAPRELAY_BRIDGE_BLOCKCHAIN_SERVICE_HPP
#define SWAPRELAY_BRIDGE_BLOCKCHAIN_SERVICE_HPP

#include "bridge/contract_events.hpp"
#include "bridge/event_stream.hpp"
#include "bridge/types.hpp"
#include <functional>
#include <string>

namespace swaprelay {
namespace bridge {

/**
 * Outcome of one asynchronous contract call.
 * Any failure is treated as retryable by the swap tracker.
 */
struct ContractCallResult {
  bool ok{false};
  std::string error;

  static ContractCallResult Success() { return ContractCallResult{true, ""}; }
  static ContractCallResult Failure(std::string reason) {
    return ContractCallResult{false, std::move(reason)};
  }
};

using ContractCallHandler = std::function<void(const ContractCallResult&)>;

/**
 * Initiator-contract client used by the relayer.
 *
 * The handler is invoked exactly once per call, possibly on another thread.
 * Transaction building, fees and signing belong to the implementation.
 */
class InitiatorContract {
public:
  virtual ~InitiatorContract() = default;

  // Claim initiator-locked funds with the pre-image revealed on the other chain
  virtual void CompleteBridgeTransfer(const BridgeTransferId& id,
                                      const HashLockPreImage& secret,
                                      ContractCallHandler handler) = 0;
};

/**
 * Counterparty-contract client used by the relayer.
 * Same threading rules as InitiatorContract.
 */
class CounterpartyContract {
public:
  virtual ~CounterpartyContract() = default;

  // Lock mirrored funds against the initiator's hash-lock
  virtual void LockBridgeTransfer(const LockDetails& details,
                                  ContractCallHandler handler) = 0;

  // Release a lock whose source-chain swap was refunded
  virtual void AbortBridgeTransfer(const BridgeTransferId& id,
                                   ContractCallHandler handler) = 0;
};

/**
 * BlockchainService - per-chain adapter consumed by the bridge
 *
 * Events() is a lazy, infinite, non-restartable stream of contract events
 * from both bridge contracts of this chain. A payload the adapter cannot
 * decode is reported as a Failed poll, which terminates only this stream.
 *
 * How events are discovered (polling, subscriptions) is up to the adapter.
 */
class BlockchainService {
public:
  virtual ~BlockchainService() = default;

  virtual std::string name() const = 0;

  virtual EventStream<ContractEvent>& Events() = 0;

  virtual InitiatorContract& initiator_contract() = 0;
  virtual CounterpartyContract& counterparty_contract() = 0;
};

} // namespace bridge
} // namespace swaprelay

#endif // SWAPRELAY_BRIDGE_BLOCKCHAIN_SERVICE_HPP
