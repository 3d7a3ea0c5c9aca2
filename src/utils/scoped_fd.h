/** LICENSE TEMPLATE */
#pragma once
#include <common/typedefs.h>

// stdlib
#include <chrono>
#include <expected>
#include <string>
#include <utility>

// fmt
#include <fmt/core.h>

namespace dapsync {

struct ConnectError
{
  enum class Kind
  {
    GetAddressInfo,
    Socket,
    Connect
  };

  Kind kind;
  std::string msg;
  int sys_errno;

  static ConnectError
  AddrInfo(const std::string &host, int gaiError) noexcept
  {
    return ConnectError{ .kind = Kind::GetAddressInfo,
      .msg = fmt::format("getaddrinfo failed for {}", host),
      .sys_errno = gaiError };
  }

  static ConnectError
  Socket(int sys) noexcept
  {
    return ConnectError{ .kind = Kind::Socket, .msg = "Failed to open socket", .sys_errno = sys };
  }

  static ConnectError
  Connect(const std::string &host, int port, int sys) noexcept
  {
    return ConnectError{
      .kind = Kind::Connect, .msg = fmt::format("Failed to connect to {}:{}", host, port), .sys_errno = sys
    };
  }
};

class ScopedFd
{
public:
  ScopedFd() noexcept;
  explicit ScopedFd(int fd) noexcept;
  ScopedFd &operator=(ScopedFd &&other) noexcept;
  ScopedFd(ScopedFd &&) noexcept;
  ScopedFd(const ScopedFd &) = delete;
  ScopedFd &operator=(const ScopedFd &) = delete;
  ~ScopedFd() noexcept;

  int Get() const noexcept;
  bool IsOpen() const noexcept;
  void Close() noexcept;
  operator int() const noexcept;
  // Give up ownership without closing. Returns the descriptor.
  int Release() noexcept;

  // Apply SO_RCVTIMEO and SO_SNDTIMEO. Returns false if either setsockopt failed.
  bool SetSocketTimeout(std::chrono::milliseconds timeout) const noexcept;
  // Write all of `data`, retrying on EINTR and short writes. Returns false on any other error.
  bool WriteAll(std::string_view data) const noexcept;

  static std::expected<ScopedFd, ConnectError> OpenSocketConnectTo(const std::string &host, int port) noexcept;
  // Creates a pipe with O_CLOEXEC set on both ends. first is the read end. Both are closed on failure.
  static std::pair<ScopedFd, ScopedFd> MakePipe() noexcept;

private:
  int mFd;
};
} // namespace dapsync
