// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "bridge/notifications.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <exception>

namespace swaprelay {
namespace bridge {

// ============================================================================
// BridgeNotifications::Subscription
// ============================================================================

BridgeNotifications::Subscription::Subscription(BridgeNotifications *owner,
                                                size_t id)
    : owner_(owner), id_(id), active_(true) {}

BridgeNotifications::Subscription::~Subscription() { Unsubscribe(); }

BridgeNotifications::Subscription::Subscription(Subscription &&other) noexcept
    : owner_(other.owner_), id_(other.id_), active_(other.active_) {
  other.owner_ = nullptr;
  other.active_ = false;
}

BridgeNotifications::Subscription &
BridgeNotifications::Subscription::operator=(Subscription &&other) noexcept {
  if (this != &other) {
    Unsubscribe();
    owner_ = other.owner_;
    id_ = other.id_;
    active_ = other.active_;
    other.owner_ = nullptr;
    other.active_ = false;
  }
  return *this;
}

void BridgeNotifications::Subscription::Unsubscribe() {
  if (active_ && owner_) {
    owner_->Unsubscribe(id_);
    active_ = false;
  }
}

// ============================================================================
// BridgeNotifications
// ============================================================================

BridgeNotifications::Subscription
BridgeNotifications::Add(EventCallback callback, bool critical_only) {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t id = next_id_++;

  CallbackEntry entry;
  entry.id = id;
  entry.critical_only = critical_only;
  entry.callback = std::move(callback);
  callbacks_.push_back(std::move(entry));

  return Subscription(this, id);
}

BridgeNotifications::Subscription
BridgeNotifications::SubscribeEvent(EventCallback callback) {
  return Add(std::move(callback), false);
}

BridgeNotifications::Subscription
BridgeNotifications::SubscribeCriticalWarning(EventCallback callback) {
  return Add(std::move(callback), true);
}

void BridgeNotifications::NotifyEvent(const Event &event) {
  const bool critical = event.IsCritical();

  std::vector<EventCallback> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot.reserve(callbacks_.size());
    for (const auto &entry : callbacks_) {
      if (!entry.callback) continue;
      if (entry.critical_only && !critical) continue;
      snapshot.push_back(entry.callback);
    }
  }
  for (auto &cb : snapshot) {
    try {
      cb(event);
    } catch (const std::exception &e) {
      LOG_BRIDGE_ERROR("BridgeNotifications: subscriber threw on {}: {}",
                       event.ToString(), e.what());
    }
  }
}

size_t BridgeNotifications::SubscriberCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return callbacks_.size();
}

void BridgeNotifications::Unsubscribe(size_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it =
      std::find_if(callbacks_.begin(), callbacks_.end(),
                   [id](const CallbackEntry &entry) { return entry.id == id; });

  if (it != callbacks_.end()) {
    callbacks_.erase(it);
  }
}

BridgeNotifications &BridgeNotifications::Get() {
  static BridgeNotifications instance;
  return instance;
}

} // namespace bridge
} // namespace swaprelay
