// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "bridge/relay_driver.hpp"
#include "bridge/notifications.hpp"
#include "util/logging.hpp"
#include <boost/asio/post.hpp>

namespace swaprelay {
namespace bridge {

RelayDriver::RelayDriver(boost::asio::io_context& io_context, EventStream<Event>& stream,
                         const Config& config)
    : io_context_(io_context),
      stream_(stream),
      config_(config),
      lifetime_token_(std::make_shared<int>(0)) {}

RelayDriver::~RelayDriver() {
  Stop();
  lifetime_token_.reset();
}

void RelayDriver::Start() {
  if (running_.exchange(true)) {
    return;
  }

  LOG_BRIDGE_INFO("RelayDriver: starting (max {} events per turn)",
                  config_.max_events_per_turn);

  std::weak_ptr<int> guard = lifetime_token_;
  stream_.SetWaker([this, guard]() {
    if (auto alive = guard.lock()) {
      ScheduleTurn();
    }
  });
  ScheduleTurn();
}

void RelayDriver::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  stream_.SetWaker(nullptr);
  LOG_BRIDGE_INFO("RelayDriver: stopped after {} event(s) in {} turn(s)",
                  events_processed_.load(), turns_.load());
}

void RelayDriver::ScheduleTurn() {
  if (!running_.load()) {
    return;
  }
  // Coalesce wakes: one queued turn drains everything available
  if (turn_scheduled_.exchange(true)) {
    return;
  }

  std::weak_ptr<int> guard = lifetime_token_;
  boost::asio::post(io_context_, [this, guard]() {
    if (guard.expired()) {
      return;
    }
    RunTurn();
  });
}

void RelayDriver::RunTurn() {
  // Cleared first so a wake arriving mid-turn queues another turn
  turn_scheduled_.store(false);
  if (!running_.load()) {
    return;
  }
  ++turns_;

  const size_t limit = config_.max_events_per_turn == 0 ? 1 : config_.max_events_per_turn;
  for (size_t produced = 0; produced < limit; ++produced) {
    auto poll = stream_.PollNext();

    switch (poll.status) {
    case PollStatus::Pending:
      return;

    case PollStatus::Ended:
    case PollStatus::Failed:
      LOG_BRIDGE_ERROR("RelayDriver: event stream terminated{}{}",
                       poll.error.empty() ? "" : ": ", poll.error);
      Stop();
      return;

    case PollStatus::Ready:
      break;
    }

    const Event& event = *poll.item;
    if (event.IsCritical()) {
      LOG_BRIDGE_ERROR("{}", event.ToString());
    } else if (event.IsWarning()) {
      LOG_BRIDGE_WARN("{}", event.ToString());
    } else {
      LOG_BRIDGE_INFO("{}", event.ToString());
    }

    ++events_processed_;
    BridgeEvents().NotifyEvent(event);

    if (!running_.load()) {
      return;
    }
  }

  // Budget exhausted with work possibly left: yield, then continue
  ScheduleTurn();
}

} // namespace bridge
} // namespace swaprelay
