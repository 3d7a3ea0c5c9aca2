/** LICENSE TEMPLATE */
#pragma once
// dapsync
#include <common/macros.h>
#include <common/typedefs.h>
#include <utils/scoped_fd.h>

// std
#include <expected>
#include <span>
#include <string>

namespace dapsync {

struct SpawnError
{
  std::string mMessage;
  int mErrno;
};

// The debug adapter, running as our child with its stdin/stdout connected to pipes we hold.
class AdapterProcess
{
  Pid mPid;
  ScopedFd mToAdapter;
  ScopedFd mFromAdapter;
  Option<int> mExitStatus{};

  AdapterProcess(Pid pid, ScopedFd toAdapter, ScopedFd fromAdapter) noexcept;

public:
  NO_COPY(AdapterProcess);
  // Closes the adapter's stdin and, if it has not exited by then, terminates it.
  ~AdapterProcess() noexcept;

  // `command[0]` is looked up in PATH. Fails if the pipes can't be created, fork fails or exec fails.
  static std::expected<UniquePtr<AdapterProcess>, SpawnError> Spawn(std::span<const std::string> command) noexcept;

  Pid GetPid() const noexcept;
  // Write end of the adapter's stdin.
  int InputFd() const noexcept;
  // Read end of the adapter's stdout.
  int OutputFd() const noexcept;
  // The adapter sees EOF on stdin.
  void CloseInput() noexcept;
  // Blocks until the adapter has exited. Returns the exit code, or 128 + signal number.
  int WaitForExit() noexcept;
  Option<int> ExitStatus() const noexcept;
};

} // namespace dapsync
