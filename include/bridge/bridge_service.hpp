// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#ifndef SWAPRELAY_BRIDGE_BRIDGE_SERVICE_HPP
#define SWAPRELAY_BRIDGE_BRIDGE_SERVICE_HPP

#include "bridge/active_swap.hpp"
#include "bridge/blockchain_service.hpp"
#include "bridge/conversion.hpp"
#include "bridge/event_stream.hpp"
#include "bridge/events.hpp"
#include <boost/asio/io_context.hpp>
#include <memory>
#include <optional>

namespace swaprelay {
namespace bridge {

/**
 * BridgeService - swap orchestrator for one chain pair
 *
 * Fuses four event sources into one unified EventStream<Event>:
 *   1. B1->B2 tracker progress  (chain 1 initiates, chain 2 fulfils)
 *   2. B2->B1 tracker progress  (mirror)
 *   3. chain 1 contract events
 *   4. chain 2 contract events
 *
 * Each PollNext() tries the sources in that order and returns the first
 * output produced, so tracker progress is never starved by chain traffic.
 *
 * Routing:
 * - an Initiated on chain X starts a swap in the X->Y tracker
 * - a counterparty Completed on chain Y claims on chain X via the X->Y tracker
 * - an initiator Refunded on chain X aborts the lock on chain Y
 *
 * A chain source that fails is reported once (critical StreamTerminated) and
 * is never polled again; the other sources keep running. The orchestrator
 * itself never ends.
 *
 * Threading: io_context thread only (see RelayDriver).
 */
class BridgeService : public EventStream<Event> {
public:
  BridgeService(boost::asio::io_context& io_context,
                std::shared_ptr<BlockchainService> chain1,
                std::shared_ptr<BlockchainService> chain2,
                std::shared_ptr<const ChainConverter> converter,
                const ActiveSwapMap::Config& config = ActiveSwapMap::Config{});

  BridgeService(const BridgeService&) = delete;
  BridgeService& operator=(const BridgeService&) = delete;

  StreamPoll<Event> PollNext() override;

  // Installs the waker on all four sources
  void SetWaker(Waker waker) override;

  ActiveSwapMap& b1_to_b2() { return b1_to_b2_; }
  ActiveSwapMap& b2_to_b1() { return b2_to_b1_; }
  const ActiveSwapMap& b1_to_b2() const { return b1_to_b2_; }
  const ActiveSwapMap& b2_to_b1() const { return b2_to_b1_; }

  // False once the chain's event stream failed or ended
  bool IsChainActive(ChainSide side) const;

private:
  // Origins used when reporting one direction's progress
  struct Direction {
    ActiveSwapMap& tracker;
    EventOrigin source_initiator;          // where claims land
    EventOrigin destination_counterparty;  // where locks and aborts land
  };

  struct ChainSource {
    std::shared_ptr<BlockchainService> service;
    EventOrigin initiator_origin;
    EventOrigin counterparty_origin;
    bool active{true};
  };

  std::optional<Event> PollTracker(const Direction& direction);
  std::optional<Event> PollChain(ChainSource& source, const Direction& outgoing,
                                 const Direction& incoming);

  // Initiator events on a chain drive the direction that starts there
  Event HandleInitiatorEvent(const ContractEvent& event, EventOrigin origin,
                             const Direction& outgoing);

  // Counterparty events on a chain drive the direction that ends there
  Event HandleCounterpartyEvent(const ContractEvent& event, EventOrigin origin,
                                const Direction& incoming);

  ChainSource chain1_;
  ChainSource chain2_;

  ActiveSwapMap b1_to_b2_;
  ActiveSwapMap b2_to_b1_;

  const Direction b1_to_b2_direction_;
  const Direction b2_to_b1_direction_;
};

} // namespace bridge
} // namespace swaprelay

#endif // SWAPRELAY_BRIDGE_BRIDGE_SERVICE_HPP
