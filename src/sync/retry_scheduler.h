/** LICENSE TEMPLATE */
#pragma once

// dapsync
#include <common/macros.h>
#include <sync/sync_state.h>
#include <sync/timer_service.h>

// std
#include <chrono>
#include <functional>
#include <string>

namespace dapsync::sync {

// Owns the (at most one) retry timer of a session. When it fires, the currently pending address, not the one
// that was pending when it was armed, is handed to the attempt function.
class RetryScheduler
{
public:
  using Attempt = std::function<void(std::string address, u64 sequence)>;

  NO_COPY(RetryScheduler);
  RetryScheduler(TimerService &timers, SyncState &state, std::chrono::milliseconds interval,
                 Attempt attempt) noexcept;
  ~RetryScheduler() noexcept;

  // Cancel any armed timer, make `address` the pending address and arm a new timer.
  void ScheduleRetry(std::string address, u64 sequence) noexcept;
  // A newer address replaces the pending one. The timer, if armed, stays as it is. No-op with nothing pending.
  void Supersede(std::string address, u64 sequence) noexcept;
  // Arm a timer for the pending address, unless one is armed already.
  void EnsureArmed() noexcept;
  // Cancel the timer and forget the pending address.
  void Discard() noexcept;
  void SetInterval(std::chrono::milliseconds interval) noexcept;
  bool IsArmed() const noexcept;

private:
  void Arm() noexcept;
  void CancelTimer() noexcept;
  void OnTimerFired(TimerId id) noexcept;

  TimerService &mTimers;
  SyncState &mState;
  std::chrono::milliseconds mInterval;
  Attempt mAttempt;
};

} // namespace dapsync::sync
