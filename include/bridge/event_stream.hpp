// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#ifndef SWAPRELAY_BRIDGE_EVENT_STREAM_HPP
#define SWAPRELAY_BRIDGE_EVENT_STREAM_HPP

#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace swaprelay {
namespace bridge {

enum class PollStatus {
  Ready,    // an item is available
  Pending,  // nothing yet, the source will wake the scheduler later
  Ended,    // the source is exhausted and must not be polled again
  Failed    // the source hit a fatal error (reported once, then Ended)
};

template <typename T>
struct StreamPoll {
  PollStatus status{PollStatus::Pending};
  std::optional<T> item;
  std::string error;

  static StreamPoll Ready(T value) {
    StreamPoll p;
    p.status = PollStatus::Ready;
    p.item = std::move(value);
    return p;
  }
  static StreamPoll Pending() { return StreamPoll{}; }
  static StreamPoll Ended() {
    StreamPoll p;
    p.status = PollStatus::Ended;
    return p;
  }
  static StreamPoll Failed(std::string reason) {
    StreamPoll p;
    p.status = PollStatus::Failed;
    p.error = std::move(reason);
    return p;
  }

  bool ready() const { return status == PollStatus::Ready; }
};

/**
 * EventStream - lazy, infinite, non-restartable sequence of T
 *
 * Contract:
 * - PollNext() never blocks. It returns Ready with the next item, or Pending
 *   when nothing is available yet.
 * - A source that returned Pending calls its waker once new data may be
 *   available. The waker may be invoked from any thread; the scheduler is
 *   expected to re-poll on its own thread.
 * - Items of one source are delivered in emission order.
 */
template <typename T>
class EventStream {
public:
  using Waker = std::function<void()>;

  virtual ~EventStream() = default;

  virtual StreamPoll<T> PollNext() = 0;

  // Composite streams override this to forward the waker to their sources
  virtual void SetWaker(Waker waker) {
    std::lock_guard<std::mutex> lock(waker_mutex_);
    waker_ = std::move(waker);
  }

protected:
  void Wake() {
    Waker waker;
    {
      std::lock_guard<std::mutex> lock(waker_mutex_);
      waker = waker_;
    }
    if (waker) {
      waker();
    }
  }

private:
  std::mutex waker_mutex_;
  Waker waker_;
};

/**
 * QueuedEventStream - FIFO-backed EventStream
 *
 * Producers Push() from any thread; the consumer drains with PollNext().
 * Fail() terminates the stream: items queued before the failure are still
 * delivered, then Failed is reported once, then Ended forever.
 */
template <typename T>
class QueuedEventStream : public EventStream<T> {
public:
  // Returns false if the stream already failed (item dropped)
  bool Push(T item) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (failure_) {
        return false;
      }
      queue_.push_back(std::move(item));
    }
    this->Wake();
    return true;
  }

  void Fail(std::string reason) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (failure_) {
        return;
      }
      failure_ = std::move(reason);
    }
    this->Wake();
  }

  StreamPoll<T> PollNext() override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!queue_.empty()) {
      T item = std::move(queue_.front());
      queue_.pop_front();
      return StreamPoll<T>::Ready(std::move(item));
    }
    if (failure_) {
      if (failure_reported_) {
        return StreamPoll<T>::Ended();
      }
      failure_reported_ = true;
      return StreamPoll<T>::Failed(*failure_);
    }
    return StreamPoll<T>::Pending();
  }

  size_t queued() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
  }

private:
  mutable std::mutex mutex_;
  std::deque<T> queue_;
  std::optional<std::string> failure_;
  bool failure_reported_{false};
};

} // namespace bridge
} // namespace swaprelay

#endif // SWAPRELAY_BRIDGE_EVENT_STREAM_HPP
