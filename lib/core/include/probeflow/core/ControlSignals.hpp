#ifndef PROBEFLOW_CORE_CONTROL_SIGNALS_HPP
#define PROBEFLOW_CORE_CONTROL_SIGNALS_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace PROBEFLOW {

/**
 * @brief Pause/resume/cancel requests shared by manager and worker
 *
 * Written by the manager, read by the run at its checkpoints. Cancel stays
 * set until Reset(); resume clears a pending pause.
 */
class ControlSignals {
public:
  /// @return false if a pause was already pending
  bool RequestPause();

  /// Clear the pause request and wake a waiting run
  void RequestResume();

  /// @return false if cancel was already requested
  bool RequestCancel();

  /// Clear all requests; called at run start
  void Reset();

  bool IsPauseRequested() const { return fPauseRequested.load(); }
  bool IsCancelRequested() const { return fCancelRequested.load(); }

  /**
   * @brief Block until resumed or cancelled
   * @return true if woken by cancel
   */
  bool WaitForResumeOrCancel();

  /**
   * @brief Sleep for up to duration, waking early on cancel
   * @return true if cancel is requested
   */
  bool WaitForCancel(std::chrono::milliseconds duration);

private:
  std::atomic<bool> fPauseRequested{false};
  std::atomic<bool> fCancelRequested{false};
  std::mutex fMutex;
  std::condition_variable fCondition;
};

} // namespace PROBEFLOW

#endif // PROBEFLOW_CORE_CONTROL_SIGNALS_HPP
