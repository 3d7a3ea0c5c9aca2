/** LICENSE TEMPLATE */
#pragma once
// dapsync
#include <common/macros.h>
#include <interface/dap/parse_buffer.h>
#include <utils/worker_thread.h>

// std
#include <functional>
#include <string>
#include <string_view>

namespace dapsync {
class EventLoop;
}

namespace dapsync::ui::dap {

// One outgoing direction of the proxy. Only ever written from the control thread.
class MessageWriter
{
public:
  virtual ~MessageWriter() noexcept = default;
  // `payload` is the JSON text of one protocol message. Framing is the writer's business.
  virtual bool WriteMessage(std::string_view payload) noexcept = 0;
};

class FileDescriptorWriter final : public MessageWriter
{
  int mFd;
  bool mBroken{ false };

public:
  explicit FileDescriptorWriter(int fd) noexcept;
  ~FileDescriptorWriter() noexcept override = default;
  // Once a write has failed (the other end went away) all further writes are dropped.
  bool WriteMessage(std::string_view payload) noexcept final;
};

// Reads framed messages from a file descriptor on a worker thread and posts every complete payload to the event
// loop. `onClosed` is posted once, after the last message, when the other end closes or a read fails.
class ConnectionReader
{
public:
  using OnMessage = std::function<void(std::string payload)>;
  using OnClosed = std::function<void()>;

  NO_COPY(ConnectionReader);
  ConnectionReader(std::string name, int fd, EventLoop &loop, OnMessage onMessage, OnClosed onClosed) noexcept;
  ~ConnectionReader() noexcept;

  // Spawns the reader thread.
  void Start() noexcept;
  // Stops reading; whatever was read but not yet posted is dropped. Joins the reader thread.
  void Stop() noexcept;

private:
  void ReadLoop(std::stop_token &token) noexcept;

  std::string mName;
  int mFd;
  EventLoop &mLoop;
  OnMessage mOnMessage;
  OnClosed mOnClosed;
  MessageBuffer mBuffer{};
  WorkerThread::OwnedPtr mThread{ nullptr };
};

} // namespace dapsync::ui::dap
