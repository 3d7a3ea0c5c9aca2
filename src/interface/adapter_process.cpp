/** LICENSE TEMPLATE */
#include "adapter_process.h"

// dapsync
#include <utils/logger.h>

// std
#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>
#include <vector>

// system
#include <csignal>
#include <sys/wait.h>
#include <unistd.h>

namespace dapsync {

static constexpr auto kTerminateGracePeriod = std::chrono::milliseconds{ 500 };

AdapterProcess::AdapterProcess(Pid pid, ScopedFd toAdapter, ScopedFd fromAdapter) noexcept
    : mPid(pid), mToAdapter(std::move(toAdapter)), mFromAdapter(std::move(fromAdapter))
{
}

AdapterProcess::~AdapterProcess() noexcept
{
  CloseInput();
  if (mExitStatus) {
    return;
  }
  // Give it a chance to notice EOF before we get rude.
  const auto deadline = std::chrono::steady_clock::now() + kTerminateGracePeriod;
  while (std::chrono::steady_clock::now() < deadline) {
    int status = 0;
    if (waitpid(mPid, &status, WNOHANG) == mPid) {
      DBGLOG(core, "adapter {} exited on its own", mPid);
      return;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds{ 10 });
  }
  DBGLOG(core, "terminating adapter {}", mPid);
  kill(mPid, SIGTERM);
  WaitForExit();
}

static int
ExitCodeFromStatus(int status) noexcept
{
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

/* static */
std::expected<UniquePtr<AdapterProcess>, SpawnError>
AdapterProcess::Spawn(std::span<const std::string> command) noexcept
{
  if (command.empty()) {
    return std::unexpected(SpawnError{ .mMessage = "no debug adapter command given", .mErrno = 0 });
  }

  auto [stdinRead, stdinWrite] = ScopedFd::MakePipe();
  auto [stdoutRead, stdoutWrite] = ScopedFd::MakePipe();
  // Reports a failed exec back to us. Closed by a successful exec because of O_CLOEXEC.
  auto [execErrorRead, execErrorWrite] = ScopedFd::MakePipe();
  if (!stdinRead.IsOpen() || !stdoutRead.IsOpen() || !execErrorRead.IsOpen()) {
    return std::unexpected(SpawnError{ .mMessage = "failed to create pipes", .mErrno = errno });
  }

  std::vector<char *> argv;
  argv.reserve(command.size() + 1);
  for (const auto &arg : command) {
    argv.push_back(const_cast<char *>(arg.c_str()));
  }
  argv.push_back(nullptr);

  const Pid pid = fork();
  if (pid == -1) {
    return std::unexpected(SpawnError{ .mMessage = "fork failed", .mErrno = errno });
  }

  if (pid == 0) {
    // Child: only async-signal-safe calls from here on.
    if (dup2(stdinRead.Get(), STDIN_FILENO) == -1 || dup2(stdoutWrite.Get(), STDOUT_FILENO) == -1) {
      const int err = errno;
      [[maybe_unused]] auto written = write(execErrorWrite.Get(), &err, sizeof(err));
      _exit(127);
    }
    signal(SIGPIPE, SIG_DFL);
    execvp(argv[0], argv.data());
    const int err = errno;
    [[maybe_unused]] auto written = write(execErrorWrite.Get(), &err, sizeof(err));
    _exit(127);
  }

  execErrorWrite.Close();
  stdinRead.Close();
  stdoutWrite.Close();

  int childErrno = 0;
  ssize_t bytesRead = 0;
  do {
    bytesRead = read(execErrorRead.Get(), &childErrno, sizeof(childErrno));
  } while (bytesRead == -1 && errno == EINTR);

  if (bytesRead > 0) {
    int status = 0;
    waitpid(pid, &status, 0);
    return std::unexpected(SpawnError{
      .mMessage = fmt::format("failed to execute '{}': {}", command.front(), strerror(childErrno)),
      .mErrno = childErrno });
  }

  DBGLOG(core, "spawned debug adapter '{}' as pid {}", command.front(), pid);
  return UniquePtr<AdapterProcess>{ new AdapterProcess{ pid, std::move(stdinWrite), std::move(stdoutRead) } };
}

Pid
AdapterProcess::GetPid() const noexcept
{
  return mPid;
}

int
AdapterProcess::InputFd() const noexcept
{
  return mToAdapter.Get();
}

int
AdapterProcess::OutputFd() const noexcept
{
  return mFromAdapter.Get();
}

void
AdapterProcess::CloseInput() noexcept
{
  mToAdapter.Close();
}

int
AdapterProcess::WaitForExit() noexcept
{
  if (mExitStatus) {
    return *mExitStatus;
  }
  int status = 0;
  Pid result = 0;
  do {
    result = waitpid(mPid, &status, 0);
  } while (result == -1 && errno == EINTR);

  if (result == -1) {
    DBGLOG(warning, "waitpid for adapter {} failed: {}", mPid, strerror(errno));
    mExitStatus = -1;
  } else {
    mExitStatus = ExitCodeFromStatus(status);
  }
  DBGLOG(core, "adapter {} exited with {}", mPid, *mExitStatus);
  return *mExitStatus;
}

Option<int>
AdapterProcess::ExitStatus() const noexcept
{
  return mExitStatus;
}

} // namespace dapsync
