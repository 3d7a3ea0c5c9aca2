/** LICENSE TEMPLATE */
#pragma once
// stdlib
#include <functional>
#include <memory>
#include <stop_token>
#include <string>
#include <thread>

namespace dapsync {

// A named std::jthread. The name shows up in /proc, gdb and perf which makes the handful of threads dapsync runs
// tell-apart-able. Destroying a WorkerThread requests stop and joins.
class WorkerThread
{
  std::string mThreadName;
  explicit WorkerThread(std::string &&name, std::function<void(std::stop_token &)> &&task) noexcept;

public:
  using OwnedPtr = std::unique_ptr<WorkerThread>;

  ~WorkerThread() noexcept;
  static OwnedPtr SpawnWorkerThread(std::string threadName, std::function<void(std::stop_token &)> task) noexcept;

  /// Start the thread.
  void Start() noexcept;
  /// Join the thread.
  void Join() noexcept;
  /// Check if the thread is joinable.
  bool IsJoinable() const noexcept;
  /// Request jthread to stop
  bool RequestStop() noexcept;

private:
  std::function<void(std::stop_token &tok)> mWork;
  std::jthread mThread;
  bool mStarted;
};
} // namespace dapsync
