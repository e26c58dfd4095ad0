#include "Subscription.hpp"

namespace PROBEFLOW
{

Subscription::Subscription(size_t capacity)
    : fCapacity(capacity == 0 ? 1 : capacity)
{
}

void Subscription::Deliver(const ProgressEvent &event)
{
  {
    std::lock_guard<std::mutex> lock(fMutex);
    if (fClosed) {
      return;
    }
    if (fQueue.size() >= fCapacity) {
      fQueue.pop_front();
      ++fDropped;
    }
    fQueue.push_back(event);
  }
  fCondition.notify_one();
}

std::optional<ProgressEvent> Subscription::Next(std::chrono::milliseconds timeout)
{
  std::unique_lock<std::mutex> lock(fMutex);
  fCondition.wait_for(lock, timeout, [this] { return fClosed || !fQueue.empty(); });
  if (fQueue.empty()) {
    return std::nullopt;
  }
  ProgressEvent event = std::move(fQueue.front());
  fQueue.pop_front();
  return event;
}

std::optional<ProgressEvent> Subscription::TryNext()
{
  std::lock_guard<std::mutex> lock(fMutex);
  if (fQueue.empty()) {
    return std::nullopt;
  }
  ProgressEvent event = std::move(fQueue.front());
  fQueue.pop_front();
  return event;
}

void Subscription::Close()
{
  {
    std::lock_guard<std::mutex> lock(fMutex);
    fClosed = true;
  }
  fCondition.notify_all();
}

bool Subscription::IsClosed() const
{
  std::lock_guard<std::mutex> lock(fMutex);
  return fClosed;
}

uint64_t Subscription::Dropped() const
{
  std::lock_guard<std::mutex> lock(fMutex);
  return fDropped;
}

size_t Subscription::Pending() const
{
  std::lock_guard<std::mutex> lock(fMutex);
  return fQueue.size();
}

}  // namespace PROBEFLOW
