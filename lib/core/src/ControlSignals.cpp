#include "probeflow/core/ControlSignals.hpp"

namespace PROBEFLOW {

bool ControlSignals::RequestPause() {
  std::lock_guard<std::mutex> lock(fMutex);
  if (fPauseRequested.load()) {
    return false;
  }
  fPauseRequested = true;
  return true;
}

void ControlSignals::RequestResume() {
  {
    std::lock_guard<std::mutex> lock(fMutex);
    fPauseRequested = false;
  }
  fCondition.notify_all();
}

bool ControlSignals::RequestCancel() {
  bool first = false;
  {
    std::lock_guard<std::mutex> lock(fMutex);
    first = !fCancelRequested.load();
    fCancelRequested = true;
  }
  fCondition.notify_all();
  return first;
}

void ControlSignals::Reset() {
  std::lock_guard<std::mutex> lock(fMutex);
  fPauseRequested = false;
  fCancelRequested = false;
}

bool ControlSignals::WaitForResumeOrCancel() {
  std::unique_lock<std::mutex> lock(fMutex);
  fCondition.wait(lock, [this] {
    return !fPauseRequested.load() || fCancelRequested.load();
  });
  return fCancelRequested.load();
}

bool ControlSignals::WaitForCancel(std::chrono::milliseconds duration) {
  std::unique_lock<std::mutex> lock(fMutex);
  fCondition.wait_for(lock, duration, [this] { return fCancelRequested.load(); });
  return fCancelRequested.load();
}

} // namespace PROBEFLOW
