/**
 * @file EventChannel.hpp
 * @brief Bounded blocking FIFO between the run worker and the broadcaster
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace PROBEFLOW
{

/**
 * @brief Single-producer, single-consumer bounded queue
 *
 * Push blocks while the queue is full, so a slow consumer slows the
 * producer down instead of losing items. After Close(), Push fails and Pop
 * drains what is left.
 */
template <typename T>
class EventChannel
{
 public:
  explicit EventChannel(size_t capacity) : fCapacity(capacity == 0 ? 1 : capacity)
  {
  }

  /// @return false if the channel was closed
  bool Push(T item)
  {
    std::unique_lock<std::mutex> lock(fMutex);
    fNotFull.wait(lock, [this] { return fClosed || fQueue.size() < fCapacity; });
    if (fClosed) {
      return false;
    }
    fQueue.push_back(std::move(item));
    fNotEmpty.notify_one();
    return true;
  }

  /// Wait up to timeout for an item; nullopt on timeout or closed and empty
  std::optional<T> Pop(std::chrono::milliseconds timeout)
  {
    std::unique_lock<std::mutex> lock(fMutex);
    fNotEmpty.wait_for(lock, timeout,
                       [this] { return fClosed || !fQueue.empty(); });
    if (fQueue.empty()) {
      return std::nullopt;
    }
    T item = std::move(fQueue.front());
    fQueue.pop_front();
    fNotFull.notify_one();
    return item;
  }

  void Close()
  {
    {
      std::lock_guard<std::mutex> lock(fMutex);
      fClosed = true;
    }
    fNotFull.notify_all();
    fNotEmpty.notify_all();
  }

  bool IsClosed() const
  {
    std::lock_guard<std::mutex> lock(fMutex);
    return fClosed;
  }

  size_t Size() const
  {
    std::lock_guard<std::mutex> lock(fMutex);
    return fQueue.size();
  }

  size_t Capacity() const { return fCapacity; }

 private:
  const size_t fCapacity;
  mutable std::mutex fMutex;
  std::condition_variable fNotFull;
  std::condition_variable fNotEmpty;
  std::deque<T> fQueue;
  bool fClosed = false;
};

}  // namespace PROBEFLOW
