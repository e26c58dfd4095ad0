/**
 * @file Subscription.hpp
 * @brief Per-subscriber queue of progress events
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

#include "probeflow/core/ProgressEvent.hpp"

namespace PROBEFLOW
{

/**
 * @brief Bounded FIFO owned by one consumer
 *
 * When full, delivering a new event discards the oldest queued one and
 * increments Dropped(). Events are otherwise delivered in emission order.
 * Releasing the last shared_ptr, or calling Close(), unsubscribes.
 */
class Subscription
{
 public:
  explicit Subscription(size_t capacity);

  /// Broadcaster side; ignored once closed
  void Deliver(const ProgressEvent &event);

  /// Wait up to timeout; nullopt on timeout or when closed and drained
  std::optional<ProgressEvent> Next(std::chrono::milliseconds timeout);

  std::optional<ProgressEvent> TryNext();

  void Close();
  bool IsClosed() const;

  uint64_t Dropped() const;
  size_t Pending() const;

 private:
  const size_t fCapacity;
  mutable std::mutex fMutex;
  std::condition_variable fCondition;
  std::deque<ProgressEvent> fQueue;
  uint64_t fDropped = 0;
  bool fClosed = false;
};

}  // namespace PROBEFLOW
