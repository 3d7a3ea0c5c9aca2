/** LICENSE TEMPLATE */
#pragma once
// dapsync
#include <common/macros.h>
#include <common/typedefs.h>
#include <interface/dap/protocol.h>
#include <sync/debug_session.h>

// std
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace dapsync::ui::dap {

using ResponseHandler = std::function<void(const Dict &response)>;

// Something that can put a request of our own in front of the debug adapter.
class AdapterRequester
{
public:
  virtual ~AdapterRequester() noexcept = default;
  // `onResponse` runs on the control thread when (if) the adapter responds. Never from inside this call.
  virtual void SendRequest(std::string_view command, Dict arguments, ResponseHandler onResponse) noexcept = 0;
};

struct StackFrameRecord
{
  u32 mIndex;
  Option<std::string> mInstructionPointerReference;
};

// One debugging session as seen through the DAP traffic: the frames the adapter has reported since the last
// stop, which one the user is looking at, and register reads via `evaluate`.
class DapSessionHost final : public sync::DebugSessionHost
{
  SessionId mSessionId;
  AdapterRequester &mRequester;
  std::unordered_map<i64, StackFrameRecord> mFrames{};
  Option<sync::FrameInfo> mCurrentFrame{};
  // Bumped every time execution resumes or stops. Lets a late stackTrace response tell it is stale.
  u64 mGeneration{ 0 };

public:
  NO_COPY(DapSessionHost);
  DapSessionHost(SessionId sessionId, AdapterRequester &requester) noexcept;
  ~DapSessionHost() noexcept override = default;

  SessionId GetSessionId() const noexcept final;
  Option<sync::FrameInfo> CurrentFrame() const noexcept final;
  void Evaluate(std::string expression, const sync::FrameInfo &frame,
                std::function<void(sync::EvaluateResult)> onResult) noexcept final;

  // Record the frames of a `stackTrace` response body. Frame `i` of the response has index `startFrame + i`.
  // Returns the number of frames recorded.
  u32 RecordStackTrace(const Dict &body, u32 startFrame) noexcept;
  Option<sync::FrameInfo> LookupFrame(i64 frameId) const noexcept;
  // Make a previously reported frame the current one. Unknown ids leave the current frame alone.
  Option<sync::FrameInfo> SelectFrame(i64 frameId) noexcept;
  void SetCurrentFrame(sync::FrameInfo frame) noexcept;
  // Frame ids die when execution resumes. Returns the new generation.
  u64 ClearFrames() noexcept;
  u64 Generation() const noexcept;
  u32 KnownFrames() const noexcept;

  // Turns an `evaluate` response into a register value. Anything but a successful response with a non-empty
  // `result` is an error.
  static sync::EvaluateResult EvaluateResponseToResult(const Dict &response) noexcept;
};

} // namespace dapsync::ui::dap
