/** LICENSE TEMPLATE */
#include "dap_session_host.h"

// dapsync
#include <utils/logger.h>

namespace dapsync::ui::dap {

DapSessionHost::DapSessionHost(SessionId sessionId, AdapterRequester &requester) noexcept
    : mSessionId(sessionId), mRequester(requester)
{
}

SessionId
DapSessionHost::GetSessionId() const noexcept
{
  return mSessionId;
}

Option<sync::FrameInfo>
DapSessionHost::CurrentFrame() const noexcept
{
  return mCurrentFrame;
}

void
DapSessionHost::Evaluate(std::string expression, const sync::FrameInfo &frame,
                         std::function<void(sync::EvaluateResult)> onResult) noexcept
{
  Dict arguments;
  arguments["expression"] = expression;
  arguments["context"] = "watch";
  if (frame.mFrameId) {
    arguments["frameId"] = *frame.mFrameId;
  }
  DBGLOG(dap, "[session {}] evaluate '{}' in frame #{}", mSessionId, expression, frame.mIndex);
  mRequester.SendRequest("evaluate", std::move(arguments), [onResult = std::move(onResult)](const Dict &response) {
    onResult(EvaluateResponseToResult(response));
  });
}

/* static */
sync::EvaluateResult
DapSessionHost::EvaluateResponseToResult(const Dict &response) noexcept
{
  if (!GetBoolean(response, "success").value_or(false)) {
    return std::unexpected(
      sync::EvaluateError{ .mMessage = GetString(response, "message").value_or("evaluate request failed") });
  }
  const Dict *body = GetObject(response, "body");
  if (body == nullptr) {
    return std::unexpected(sync::EvaluateError{ .mMessage = "evaluate response has no body" });
  }
  auto result = GetString(*body, "result");
  if (!result || result->empty()) {
    return std::unexpected(sync::EvaluateError{ .mMessage = "evaluate response has no result" });
  }
  return std::move(*result);
}

u32
DapSessionHost::RecordStackTrace(const Dict &body, u32 startFrame) noexcept
{
  const Dict *frames = GetArray(body, "stackFrames");
  if (frames == nullptr) {
    return 0;
  }
  u32 index = startFrame;
  u32 recorded = 0;
  for (const auto &frame : *frames) {
    const auto id = GetInteger(frame, "id");
    if (id) {
      mFrames[*id] = StackFrameRecord{ .mIndex = index,
        .mInstructionPointerReference = GetString(frame, "instructionPointerReference") };
      ++recorded;
    }
    ++index;
  }
  DBGLOG(dap, "[session {}] recorded {} frames starting at #{}", mSessionId, recorded, startFrame);
  return recorded;
}

Option<sync::FrameInfo>
DapSessionHost::LookupFrame(i64 frameId) const noexcept
{
  const auto it = mFrames.find(frameId);
  if (it == std::end(mFrames)) {
    return std::nullopt;
  }
  return sync::FrameInfo{ .mIndex = it->second.mIndex,
    .mFrameId = frameId,
    .mInstructionPointerReference = it->second.mInstructionPointerReference };
}

Option<sync::FrameInfo>
DapSessionHost::SelectFrame(i64 frameId) noexcept
{
  auto frame = LookupFrame(frameId);
  if (frame) {
    mCurrentFrame = frame;
  }
  return frame;
}

void
DapSessionHost::SetCurrentFrame(sync::FrameInfo frame) noexcept
{
  mCurrentFrame = std::move(frame);
}

u64
DapSessionHost::ClearFrames() noexcept
{
  mFrames.clear();
  mCurrentFrame.reset();
  return ++mGeneration;
}

u64
DapSessionHost::Generation() const noexcept
{
  return mGeneration;
}

u32
DapSessionHost::KnownFrames() const noexcept
{
  return static_cast<u32>(mFrames.size());
}

} // namespace dapsync::ui::dap
