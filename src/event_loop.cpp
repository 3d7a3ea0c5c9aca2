/** LICENSE TEMPLATE */
#include "event_loop.h"

// dapsync
#include <utils/logger.h>

// std
#include <algorithm>

namespace dapsync {

void
EventLoop::Post(Task task) noexcept
{
  {
    std::lock_guard lock(mMutex);
    mPosted.push_back(std::move(task));
  }
  mWakeUp.notify_one();
}

void
EventLoop::Stop() noexcept
{
  {
    std::lock_guard lock(mMutex);
    mStopRequested = true;
  }
  mWakeUp.notify_all();
}

bool
EventLoop::StopRequested() const noexcept
{
  std::lock_guard lock(mMutex);
  return mStopRequested;
}

TimerId
EventLoop::ScheduleAfter(std::chrono::milliseconds delay, std::function<void()> task) noexcept
{
  TimerId id;
  {
    std::lock_guard lock(mMutex);
    id = mNextTimerId++;
    const auto deadline = Clock::now() + delay;
    mDeadlines.emplace(deadline, id);
    mTimers.emplace(id, Timer{ .mDeadline = deadline, .mTask = std::move(task) });
  }
  // The new deadline may be earlier than the one Run is currently waiting for.
  mWakeUp.notify_one();
  return id;
}

bool
EventLoop::Cancel(TimerId id) noexcept
{
  std::lock_guard lock(mMutex);
  auto it = mTimers.find(id);
  if (it == std::end(mTimers)) {
    return false;
  }

  auto [begin, end] = mDeadlines.equal_range(it->second.mDeadline);
  for (auto deadline = begin; deadline != end; ++deadline) {
    if (deadline->second == id) {
      mDeadlines.erase(deadline);
      break;
    }
  }
  mTimers.erase(it);
  return true;
}

u32
EventLoop::PendingTimers() const noexcept
{
  std::lock_guard lock(mMutex);
  return static_cast<u32>(mTimers.size());
}

void
EventLoop::TakeReady(std::deque<Task> &posted, std::vector<TimerId> &dueTimers) noexcept
{
  posted.swap(mPosted);

  const auto now = Clock::now();
  while (!mDeadlines.empty() && mDeadlines.begin()->first <= now) {
    dueTimers.push_back(mDeadlines.begin()->second);
    mDeadlines.erase(mDeadlines.begin());
  }
}

u32
EventLoop::RunOnce(std::chrono::milliseconds maxWait) noexcept
{
  std::deque<Task> posted;
  std::vector<TimerId> dueTimers;
  {
    std::unique_lock lock(mMutex);
    if (mPosted.empty() && !mStopRequested) {
      auto waitUntil = Clock::now() + maxWait;
      if (!mDeadlines.empty()) {
        waitUntil = std::min(waitUntil, mDeadlines.begin()->first);
      }
      // Any Post, ScheduleAfter or Stop wakes us up early. The caller loops, so a spurious wake up is harmless.
      mWakeUp.wait_until(lock, waitUntil);
    }
    TakeReady(posted, dueTimers);
  }

  u32 count = 0;
  for (auto &task : posted) {
    task();
    ++count;
  }

  // Looked up one at a time: a timer callback may cancel another timer that is due in the same batch.
  for (const auto id : dueTimers) {
    Task task;
    {
      std::lock_guard lock(mMutex);
      auto it = mTimers.find(id);
      if (it == std::end(mTimers)) {
        continue;
      }
      task = std::move(it->second.mTask);
      mTimers.erase(it);
    }
    task();
    ++count;
  }
  return count;
}

void
EventLoop::Run() noexcept
{
  DBGLOG(core, "event loop running");
  while (!StopRequested()) {
    RunOnce(std::chrono::milliseconds{ 1000 });
  }
  DBGLOG(core, "event loop stopped");
}

} // namespace dapsync
