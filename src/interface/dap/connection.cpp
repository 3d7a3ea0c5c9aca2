/** LICENSE TEMPLATE */
#include "connection.h"

// dapsync
#include <common/panic.h>
#include <event_loop.h>
#include <utils/logger.h>
#include <utils/scoped_fd.h>

// std
#include <array>
#include <cerrno>
#include <cstring>

// system
#include <poll.h>
#include <unistd.h>

namespace dapsync::ui::dap {

// How often a blocked reader checks whether it has been asked to stop.
static constexpr int kPollTimeoutMs = 100;

FileDescriptorWriter::FileDescriptorWriter(int fd) noexcept : mFd(fd) {}

bool
FileDescriptorWriter::WriteMessage(std::string_view payload) noexcept
{
  if (mBroken) {
    return false;
  }
  const auto framed = FrameProtocolMessage(payload);
  // ScopedFd only borrows the descriptor here; ownership stays with whoever gave it to us.
  ScopedFd borrowed{ mFd };
  const bool ok = borrowed.WriteAll(framed);
  borrowed.Release();
  if (!ok) {
    DBGLOG(warning, "write to fd {} failed: {}. Dropping further output", mFd, strerror(errno));
    mBroken = true;
  }
  return ok;
}

ConnectionReader::ConnectionReader(std::string name, int fd, EventLoop &loop, OnMessage onMessage,
                                   OnClosed onClosed) noexcept
    : mName(std::move(name)), mFd(fd), mLoop(loop), mOnMessage(std::move(onMessage)),
      mOnClosed(std::move(onClosed))
{
}

ConnectionReader::~ConnectionReader() noexcept { Stop(); }

void
ConnectionReader::Start() noexcept
{
  VERIFY(mThread == nullptr, "reader {} already started", mName);
  mThread = WorkerThread::SpawnWorkerThread(mName, [this](std::stop_token &token) { ReadLoop(token); });
}

void
ConnectionReader::Stop() noexcept
{
  if (mThread && mThread->IsJoinable()) {
    mThread->RequestStop();
    mThread->Join();
  }
}

void
ConnectionReader::ReadLoop(std::stop_token &token) noexcept
{
  std::array<char, 16 * 1024> chunk{};
  pollfd pfd{ .fd = mFd, .events = POLLIN, .revents = 0 };

  while (!token.stop_requested()) {
    const auto ready = poll(&pfd, 1, kPollTimeoutMs);
    if (ready == 0 || (ready == -1 && errno == EINTR)) {
      continue;
    }
    if (ready == -1) {
      DBGLOG(warning, "poll on fd {} failed: {}", mFd, strerror(errno));
      break;
    }

    const auto bytes = read(mFd, chunk.data(), chunk.size());
    if (bytes == -1 && (errno == EINTR || errno == EAGAIN)) {
      continue;
    }
    if (bytes <= 0) {
      DBGLOG(dap, "fd {} closed ({})", mFd, bytes == 0 ? "eof" : strerror(errno));
      break;
    }

    mBuffer.Append(std::string_view{ chunk.data(), static_cast<size_t>(bytes) });
    for (auto &message : mBuffer.TakeMessages()) {
      mLoop.Post(
        [onMessage = mOnMessage, message = std::move(message)]() mutable { onMessage(std::move(message)); });
    }
  }

  if (!token.stop_requested()) {
    mLoop.Post([onClosed = mOnClosed]() { onClosed(); });
  }
}

} // namespace dapsync::ui::dap
