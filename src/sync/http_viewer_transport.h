/** LICENSE TEMPLATE */
#pragma once

// dapsync
#include <common/macros.h>
#include <sync/viewer_transport.h>
#include <utils/worker_thread.h>

// std
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>

namespace dapsync::sync {

// Talks HTTP/1.1 to the viewer's goto server: `POST /goto` with `{"address": "<hex>"}`. Requests run one at a
// time, in order, on a worker thread; completions are handed to `CompletionPoster`, which puts them on the
// control thread.
class HttpViewerTransport final : public ViewerTransport
{
public:
  using CompletionPoster = std::function<void(std::function<void()>)>;
  static constexpr auto kDefaultIoTimeout = std::chrono::milliseconds{ 2000 };

  NO_COPY(HttpViewerTransport);
  explicit HttpViewerTransport(CompletionPoster poster,
                               std::chrono::milliseconds ioTimeout = kDefaultIoTimeout) noexcept;
  // Requests still queued are dropped without completing.
  ~HttpViewerTransport() noexcept override;

  void PostGoto(const ViewerEndpoint &endpoint, std::string address,
                std::function<void(TransportResult)> onComplete) noexcept final;

  // Blocking. Used by the worker and by the one-shot `--goto` mode.
  static TransportResult SendGotoRequest(const ViewerEndpoint &endpoint, std::string_view address,
                                         std::chrono::milliseconds ioTimeout) noexcept;
  static std::string BuildGotoRequest(const ViewerEndpoint &endpoint, std::string_view address) noexcept;
  // Status code of a response starting with `HTTP/1.x <code>`.
  static Option<u16> ParseStatusLine(std::string_view response) noexcept;

private:
  struct Request
  {
    ViewerEndpoint mEndpoint;
    std::string mAddress;
    std::function<void(TransportResult)> mOnComplete;
  };

  void WorkerLoop(std::stop_token &token) noexcept;

  CompletionPoster mPoster;
  std::chrono::milliseconds mIoTimeout;
  std::mutex mQueueMutex{};
  std::condition_variable_any mQueueChanged{};
  std::deque<Request> mQueue{};
  // Last, so that it is stopped and joined before anything it uses goes away.
  WorkerThread::OwnedPtr mWorker{ nullptr };
};

} // namespace dapsync::sync
