/** LICENSE TEMPLATE */
#include "worker_thread.h"

// dapsync
#include <common/panic.h>

// system
#include <sys/prctl.h>

namespace dapsync {
WorkerThread::WorkerThread(std::string &&name, std::function<void(std::stop_token &)> &&task) noexcept
    : mThreadName(std::move(name)), mWork(std::move(task)), mThread(), mStarted(false)
{
}

WorkerThread::~WorkerThread() noexcept
{
  mThread.request_stop();
  if (mThread.joinable()) {
    mThread.join();
  }
}

/* static */
WorkerThread::OwnedPtr
WorkerThread::SpawnWorkerThread(std::string name, std::function<void(std::stop_token &)> task) noexcept
{
  auto thread = std::unique_ptr<WorkerThread>(new WorkerThread{ std::move(name), std::move(task) });
  thread->Start();
  return thread;
}

void
WorkerThread::Start() noexcept
{
  VERIFY(mStarted == false, "Thread {} already started", mThreadName);
  mStarted = true;
  mThread = std::jthread([this](std::stop_token token) {
    // Linux caps thread names at 15 characters + null terminator.
    const auto name = mThreadName.substr(0, 15);
    VERIFY(prctl(PR_SET_NAME, name.c_str()) != -1, "Failed to set WorkerThread name.");
    mWork(token);
  });
}

void
WorkerThread::Join() noexcept
{
  if (mThread.joinable()) {
    mThread.join();
  }
}

bool
WorkerThread::IsJoinable() const noexcept
{
  return mThread.joinable();
}

bool
WorkerThread::RequestStop() noexcept
{
  return mThread.request_stop();
}
} // namespace dapsync
