/** LICENSE TEMPLATE */
#include "http_viewer_transport.h"

// dapsync
#include <utils/logger.h>
#include <utils/scoped_fd.h>
#include <utils/util.h>

// std
#include <array>
#include <cerrno>
#include <cstring>

// nlohmann
#include <nlohmann/json.hpp>

// system
#include <unistd.h>

namespace dapsync::sync {

HttpViewerTransport::HttpViewerTransport(CompletionPoster poster, std::chrono::milliseconds ioTimeout) noexcept
    : mPoster(std::move(poster)), mIoTimeout(ioTimeout)
{
  mWorker = WorkerThread::SpawnWorkerThread("dapsync-http", [this](std::stop_token &token) { WorkerLoop(token); });
}

HttpViewerTransport::~HttpViewerTransport() noexcept
{
  mWorker->RequestStop();
  mQueueChanged.notify_all();
  mWorker->Join();
  if (!mQueue.empty()) {
    DBGLOG(transport, "dropping {} unsent goto requests", mQueue.size());
  }
}

void
HttpViewerTransport::PostGoto(const ViewerEndpoint &endpoint, std::string address,
                              std::function<void(TransportResult)> onComplete) noexcept
{
  {
    std::lock_guard lock(mQueueMutex);
    mQueue.push_back(
      Request{ .mEndpoint = endpoint, .mAddress = std::move(address), .mOnComplete = std::move(onComplete) });
  }
  mQueueChanged.notify_one();
}

void
HttpViewerTransport::WorkerLoop(std::stop_token &token) noexcept
{
  while (!token.stop_requested()) {
    Request request;
    {
      std::unique_lock lock(mQueueMutex);
      if (!mQueueChanged.wait(lock, token, [this]() { return !mQueue.empty(); })) {
        return;
      }
      request = std::move(mQueue.front());
      mQueue.pop_front();
    }

    auto result = SendGotoRequest(request.mEndpoint, request.mAddress, mIoTimeout);
    mPoster([onComplete = std::move(request.mOnComplete), result = std::move(result)]() mutable {
      onComplete(std::move(result));
    });
  }
}

/* static */
std::string
HttpViewerTransport::BuildGotoRequest(const ViewerEndpoint &endpoint, std::string_view address) noexcept
{
  const nlohmann::json body{ { "address", address } };
  const auto payload = body.dump();
  const bool bracketHost = endpoint.mHost.find(':') != std::string::npos;
  return fmt::format("POST /goto HTTP/1.1\r\n"
                     "Host: {}{}{}:{}\r\n"
                     "Content-Type: application/json\r\n"
                     "Content-Length: {}\r\n"
                     "Connection: close\r\n"
                     "\r\n"
                     "{}",
    bracketHost ? "[" : "",
    endpoint.mHost,
    bracketHost ? "]" : "",
    endpoint.mPort,
    payload.size(),
    payload);
}

/* static */
Option<u16>
HttpViewerTransport::ParseStatusLine(std::string_view response) noexcept
{
  // HTTP/1.0 200 OK, HTTP/1.1 404 Not Found, ...
  static constexpr std::string_view kPrefix = "HTTP/1.";
  if (!response.starts_with(kPrefix) || response.size() < kPrefix.size() + 1) {
    return std::nullopt;
  }
  response.remove_prefix(kPrefix.size() + 1);
  if (response.empty() || response.front() != ' ') {
    return std::nullopt;
  }
  response.remove_prefix(1);
  if (response.size() < 3) {
    return std::nullopt;
  }
  const auto code = response.substr(0, 3);
  if (response.size() > 3 && response[3] != ' ' && response[3] != '\r' && response[3] != '\n') {
    return std::nullopt;
  }
  auto status = ToIntegral<u16>(code);
  if (!status || *status < 100 || *status > 599) {
    return std::nullopt;
  }
  return status;
}

/* static */
TransportResult
HttpViewerTransport::SendGotoRequest(const ViewerEndpoint &endpoint, std::string_view address,
                                     std::chrono::milliseconds ioTimeout) noexcept
{
  auto socket = ScopedFd::OpenSocketConnectTo(endpoint.mHost, endpoint.mPort);
  if (!socket) {
    const auto &error = socket.error();
    return std::unexpected(
      TransportError{ .mKind = TransportError::Kind::Connect, .mMessage = error.msg, .mErrno = error.sys_errno });
  }

  if (!socket->SetSocketTimeout(ioTimeout)) {
    DBGLOG(transport, "could not set socket timeouts: {}", strerror(errno));
  }

  const auto request = BuildGotoRequest(endpoint, address);
  if (!socket->WriteAll(request)) {
    const auto err = errno;
    return std::unexpected(TransportError{ .mKind = TransportError::Kind::Send,
      .mMessage = fmt::format("send failed: {}", strerror(err)),
      .mErrno = err });
  }

  // Only the status line matters. Read until it is complete or the server hangs up.
  std::string response;
  std::array<char, 512> buffer;
  while (response.find("\r\n") == std::string::npos) {
    const auto bytesRead = ::read(socket->Get(), buffer.data(), buffer.size());
    if (bytesRead == -1) {
      if (errno == EINTR) {
        continue;
      }
      const auto err = errno;
      return std::unexpected(TransportError{ .mKind = TransportError::Kind::Receive,
        .mMessage = fmt::format("receive failed: {}", strerror(err)),
        .mErrno = err });
    }
    if (bytesRead == 0) {
      break;
    }
    response.append(buffer.data(), static_cast<size_t>(bytesRead));
  }

  if (auto status = ParseStatusLine(response); status) {
    return *status;
  }
  return std::unexpected(TransportError{ .mKind = TransportError::Kind::MalformedResponse,
    .mMessage = fmt::format("unexpected response from {}:{}: '{}'", endpoint.mHost, endpoint.mPort,
      response.substr(0, response.find("\r\n"))),
    .mErrno = 0 });
}

} // namespace dapsync::sync
