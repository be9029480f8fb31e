// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "bridge/events.hpp"
#include <functional>
#include <mutex>
#include <vector>

namespace swaprelay {
namespace bridge {

/**
 * Notification system for relay events
 *
 * - Simple observer pattern with std::function
 * - Synchronous callbacks, invoked on the notifying thread (the relay
 *   driver's io_context thread)
 * - RAII-based subscription management
 * - Singleton pattern (no wiring needed)
 *
 * Subscribers are the outward-facing consumers of the relay: the event log,
 * alerting, tests.
 */
class BridgeNotifications {
public:
  /**
   * Subscription handle - RAII wrapper
   * Automatically unsubscribes when destroyed
   */
  class Subscription {
  public:
    Subscription() = default;
    ~Subscription();

    // Movable but not copyable
    Subscription(Subscription &&other) noexcept;
    Subscription &operator=(Subscription &&other) noexcept;
    Subscription(const Subscription &) = delete;
    Subscription &operator=(const Subscription &) = delete;

    // Unsubscribe explicitly
    void Unsubscribe();

  private:
    friend class BridgeNotifications;
    Subscription(BridgeNotifications *owner, size_t id);

    BridgeNotifications *owner_{nullptr};
    size_t id_{0};
    bool active_{false};
  };

  using EventCallback = std::function<void(const Event &event)>;

  /**
   * Subscribe to every unified event
   * Returns RAII subscription handle
   */
  [[nodiscard]] Subscription SubscribeEvent(EventCallback callback);

  /**
   * Subscribe to critical warnings only (manual intervention required)
   * Returns RAII subscription handle
   */
  [[nodiscard]] Subscription SubscribeCriticalWarning(EventCallback callback);

  /**
   * Notify all subscribers of a unified event
   * Called by RelayDriver for every event the orchestrator yields.
   * A throwing subscriber is logged and does not affect the others.
   */
  void NotifyEvent(const Event &event);

  size_t SubscriberCount() const;

  /**
   * Get singleton instance
   */
  static BridgeNotifications &Get();

private:
  BridgeNotifications() = default;

  // Unsubscribe by ID (called by Subscription destructor)
  void Unsubscribe(size_t id);

  struct CallbackEntry {
    size_t id;
    bool critical_only;
    EventCallback callback;
  };

  Subscription Add(EventCallback callback, bool critical_only);

  mutable std::mutex mutex_;
  std::vector<CallbackEntry> callbacks_;
  size_t next_id_{1}; // 0 reserved for invalid
};

/**
 * Global accessor for relay event notifications
 */
inline BridgeNotifications &BridgeEvents() {
  return BridgeNotifications::Get();
}

} // namespace bridge
} // namespace swaprelay
