/** LICENSE TEMPLATE */
#pragma once

// dapsync
#include <common/typedefs.h>

// std
#include <expected>
#include <functional>
#include <string>

namespace dapsync::sync {

struct EvaluateError
{
  std::string mMessage;
};

using EvaluateResult = std::expected<std::string, EvaluateError>;

struct FrameInfo
{
  // 0 is the innermost frame.
  u32 mIndex;
  Option<i64> mFrameId;
  Option<std::string> mInstructionPointerReference;
};

// The debugger side of one debugging session.
class DebugSessionHost
{
public:
  virtual ~DebugSessionHost() noexcept = default;
  virtual SessionId GetSessionId() const noexcept = 0;
  // The frame the user currently has selected, if the debuggee is stopped.
  virtual Option<FrameInfo> CurrentFrame() const noexcept = 0;
  // Evaluate `expression` in the context of `frame`. `onResult` is called at most once, on the control thread,
  // and not from inside this call.
  virtual void Evaluate(std::string expression, const FrameInfo &frame,
                        std::function<void(EvaluateResult)> onResult) noexcept = 0;
};

} // namespace dapsync::sync
