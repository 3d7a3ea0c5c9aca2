/** LICENSE TEMPLATE */
#include "scoped_fd.h"

// dapsync
#include <common/panic.h>
#include <utils/logger.h>
#include <utils/scope_defer.h>

// stdlib
#include <cerrno>
#include <cstring>

// system
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace dapsync {

ScopedFd::ScopedFd() noexcept : mFd(-1) {}

ScopedFd::ScopedFd(int fd) noexcept : mFd(fd)
{
  VERIFY(fd != -1, "Taking ownership of a closed file or error file: {}", strerror(errno));
}

ScopedFd::ScopedFd(ScopedFd &&other) noexcept : mFd(other.mFd) { other.mFd = -1; }

ScopedFd &
ScopedFd::operator=(ScopedFd &&other) noexcept
{
  if (this == &other) {
    return *this;
  }
  Close();
  mFd = other.mFd;
  other.mFd = -1;
  return *this;
}

ScopedFd::~ScopedFd() noexcept { Close(); }

int
ScopedFd::Get() const noexcept
{
  return mFd;
}

bool
ScopedFd::IsOpen() const noexcept
{
  return mFd != -1;
}

void
ScopedFd::Close() noexcept
{
  if (mFd >= 0) {
    if (::close(mFd) != 0 && errno != EINTR && errno != EIO) {
      PANIC("Failed to close file");
    }
  }
  mFd = -1;
}

ScopedFd::operator int() const noexcept { return Get(); }

int
ScopedFd::Release() noexcept
{
  return std::exchange(mFd, -1);
}

bool
ScopedFd::SetSocketTimeout(std::chrono::milliseconds timeout) const noexcept
{
  const auto secs = std::chrono::duration_cast<std::chrono::seconds>(timeout);
  timeval tv{ .tv_sec = static_cast<time_t>(secs.count()),
    .tv_usec = static_cast<suseconds_t>(
      std::chrono::duration_cast<std::chrono::microseconds>(timeout - secs).count()) };
  return ::setsockopt(mFd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0 &&
         ::setsockopt(mFd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0;
}

bool
ScopedFd::WriteAll(std::string_view data) const noexcept
{
  while (!data.empty()) {
    const auto written = ::write(mFd, data.data(), data.size());
    if (written == -1) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    data.remove_prefix(static_cast<size_t>(written));
  }
  return true;
}

/* static */ std::expected<ScopedFd, ConnectError>
ScopedFd::OpenSocketConnectTo(const std::string &host, int port) noexcept
{
  addrinfo hints = {};
  addrinfo *result = nullptr;
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  const auto portNumber = std::to_string(port);
  if (const auto err = getaddrinfo(host.c_str(), portNumber.c_str(), &hints, &result); err != 0) {
    DBGLOG(transport, "getaddrinfo failed when attempting to connect to {}:{}. Reported reason: {}", host, port,
      gai_strerror(err));
    return std::unexpected(ConnectError::AddrInfo(host, err));
  }

  ScopedDefer defer{ [&]() { freeaddrinfo(result); } };

  bool socketErrorOnly = true;
  int lastErrno = 0;
  for (addrinfo *rp = result; rp != nullptr; rp = rp->ai_next) {
    const auto fd = ::socket(rp->ai_family, rp->ai_socktype | SOCK_CLOEXEC, rp->ai_protocol);
    if (fd == -1) {
      lastErrno = errno;
      continue;
    }
    if (::connect(fd, rp->ai_addr, rp->ai_addrlen) != -1) {
      DBGLOG(transport, "Successfully opened socket and connected to {}:{}", host, port);
      return ScopedFd{ fd };
    }
    lastErrno = errno;
    socketErrorOnly = false;
    ::close(fd);
  }
  if (socketErrorOnly) {
    DBGLOG(transport, "Failed to connect to {}:{} due to socket error. Reported reason: {}", host, port,
      strerror(lastErrno));
    return std::unexpected(ConnectError::Socket(lastErrno));
  }
  DBGLOG(transport, "Failed to connect to {}:{}. Reported reason: {}", host, port, strerror(lastErrno));
  return std::unexpected(ConnectError::Connect(host, port, lastErrno));
}

/* static */
std::pair<ScopedFd, ScopedFd>
ScopedFd::MakePipe() noexcept
{
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) == -1) {
    DBGLOG(core, "pipe2 failed: {}", strerror(errno));
    return { ScopedFd{}, ScopedFd{} };
  }
  return { ScopedFd{ fds[0] }, ScopedFd{ fds[1] } };
}
} // namespace dapsync
