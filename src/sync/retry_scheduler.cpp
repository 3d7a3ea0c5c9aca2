/** LICENSE TEMPLATE */
#include "retry_scheduler.h"

// dapsync
#include <common/panic.h>
#include <utils/logger.h>

namespace dapsync::sync {

RetryScheduler::RetryScheduler(TimerService &timers, SyncState &state, std::chrono::milliseconds interval,
                               Attempt attempt) noexcept
    : mTimers(timers), mState(state), mInterval(interval), mAttempt(std::move(attempt))
{
}

RetryScheduler::~RetryScheduler() noexcept { CancelTimer(); }

void
RetryScheduler::ScheduleRetry(std::string address, u64 sequence) noexcept
{
  CancelTimer();
  DBGLOG(sync, "retry of {} (#{}) in {}ms", address, sequence, mInterval.count());
  mState.mPendingAddress = std::move(address);
  mState.mPendingSequence = sequence;
  Arm();
}

void
RetryScheduler::Supersede(std::string address, u64 sequence) noexcept
{
  if (!mState.mPendingAddress || mState.mPendingSequence >= sequence) {
    return;
  }
  DBGLOG(sync, "pending {} (#{}) superseded by {} (#{})", *mState.mPendingAddress, mState.mPendingSequence,
    address, sequence);
  mState.mPendingAddress = std::move(address);
  mState.mPendingSequence = sequence;
}

void
RetryScheduler::EnsureArmed() noexcept
{
  if (mState.mPendingAddress && !mState.mPendingRetryHandle) {
    Arm();
  }
}

void
RetryScheduler::Discard() noexcept
{
  CancelTimer();
  if (mState.mPendingAddress) {
    DBGLOG(sync, "discarding pending address {}", *mState.mPendingAddress);
  }
  mState.mPendingAddress.reset();
}

void
RetryScheduler::SetInterval(std::chrono::milliseconds interval) noexcept
{
  mInterval = interval;
}

bool
RetryScheduler::IsArmed() const noexcept
{
  return mState.mPendingRetryHandle.has_value();
}

void
RetryScheduler::Arm() noexcept
{
  VERIFY(!mState.mPendingRetryHandle, "Arming a retry timer while another one is outstanding");
  VERIFY(mState.mPendingAddress, "Arming a retry timer with nothing pending");
  // The timer is cancelled in our destructor, so it never outlives `this`.
  auto id = std::make_shared<TimerId>(0);
  *id = mTimers.ScheduleAfter(mInterval, [this, id]() { OnTimerFired(*id); });
  mState.mPendingRetryHandle = *id;
}

void
RetryScheduler::CancelTimer() noexcept
{
  if (mState.mPendingRetryHandle) {
    mTimers.Cancel(*mState.mPendingRetryHandle);
    mState.mPendingRetryHandle.reset();
  }
}

void
RetryScheduler::OnTimerFired(TimerId id) noexcept
{
  if (mState.mPendingRetryHandle != id) {
    DBGLOG(warning, "stale retry timer {} fired", id);
    return;
  }
  mState.mPendingRetryHandle.reset();

  if (!mState.mEnabled || !mState.mPendingAddress) {
    DBGLOG(sync, "retry timer fired with nothing to do (enabled={})", mState.mEnabled);
    return;
  }

  DBGLOG(sync, "retrying {} (#{})", *mState.mPendingAddress, mState.mPendingSequence);
  mAttempt(*mState.mPendingAddress, mState.mPendingSequence);
}

} // namespace dapsync::sync
