/** LICENSE TEMPLATE */
#pragma once

// dapsync
#include <common/typedefs.h>

// std
#include <chrono>
#include <functional>

namespace dapsync::sync {

// Single-shot timers that fire on the control thread.
class TimerService
{
public:
  virtual ~TimerService() noexcept = default;
  virtual TimerId ScheduleAfter(std::chrono::milliseconds delay, std::function<void()> task) noexcept = 0;
  // Returns false if `id` already fired or was never scheduled.
  virtual bool Cancel(TimerId id) noexcept = 0;
};

} // namespace dapsync::sync
