// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "bridge/event_stream.hpp"
#include "bridge/events.hpp"
#include <atomic>
#include <boost/asio/io_context.hpp>
#include <cstdint>
#include <memory>

namespace swaprelay {
namespace bridge {

/**
 * RelayDriver - runs an event stream on an io_context
 *
 * Polling the orchestrator is what makes the relay progress; stopping the
 * driver stops the relay.
 *
 * - Start() installs a waker on the stream and schedules a first turn
 * - a wake (from any thread) posts at most one pending turn
 * - a turn polls until Pending or until max_events_per_turn events were
 *   produced, then yields back to the io_context
 * - every event is logged and published through BridgeEvents()
 */
class RelayDriver {
public:
  struct Config {
    size_t max_events_per_turn;

    Config() : max_events_per_turn(64) {}
  };

  RelayDriver(boost::asio::io_context& io_context, EventStream<Event>& stream,
              const Config& config = Config{});
  ~RelayDriver();

  RelayDriver(const RelayDriver&) = delete;
  RelayDriver& operator=(const RelayDriver&) = delete;

  void Start();
  void Stop();

  bool IsRunning() const { return running_.load(); }

  uint64_t events_processed() const { return events_processed_.load(); }
  uint64_t turns() const { return turns_.load(); }

private:
  void ScheduleTurn();
  void RunTurn();

  boost::asio::io_context& io_context_;
  EventStream<Event>& stream_;
  const Config config_;

  std::atomic<bool> running_{false};
  std::atomic<bool> turn_scheduled_{false};
  std::atomic<uint64_t> events_processed_{0};
  std::atomic<uint64_t> turns_{0};

  std::shared_ptr<int> lifetime_token_;
};

} // namespace bridge
} // namespace swaprelay
