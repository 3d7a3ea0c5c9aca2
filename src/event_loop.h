/** LICENSE TEMPLATE */
#pragma once

// dapsync
#include <common/macros.h>
#include <common/typedefs.h>
#include <sync/timer_service.h>

// std
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace dapsync {

// The control thread. Every piece of synchronization state is touched only from tasks run by this loop. Other
// threads hand their results over with Post.
class EventLoop final : public sync::TimerService
{
  using Clock = std::chrono::steady_clock;
  using Task = std::function<void()>;

  struct Timer
  {
    Clock::time_point mDeadline;
    Task mTask;
  };

  mutable std::mutex mMutex{};
  std::condition_variable mWakeUp{};
  std::deque<Task> mPosted{};
  std::multimap<Clock::time_point, TimerId> mDeadlines{};
  std::unordered_map<TimerId, Timer> mTimers{};
  TimerId mNextTimerId{ 1 };
  bool mStopRequested{ false };

  // Takes the posted tasks and the ids of the timers that are due. Caller holds mMutex.
  void TakeReady(std::deque<Task> &posted, std::vector<TimerId> &dueTimers) noexcept;

public:
  NO_COPY(EventLoop);
  EventLoop() noexcept = default;
  ~EventLoop() noexcept override = default;

  // Thread safe.
  void Post(Task task) noexcept;
  // Thread safe. Makes Run return after the task it is currently running, if any.
  void Stop() noexcept;
  bool StopRequested() const noexcept;

  TimerId ScheduleAfter(std::chrono::milliseconds delay, std::function<void()> task) noexcept final;
  bool Cancel(TimerId id) noexcept final;
  u32 PendingTimers() const noexcept;

  // Run until Stop.
  void Run() noexcept;
  // Run what is ready, waiting at most `maxWait` for something to become ready. Returns the number of tasks run.
  u32 RunOnce(std::chrono::milliseconds maxWait) noexcept;
};

} // namespace dapsync
