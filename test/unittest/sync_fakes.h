#pragma once
// Hand-driven stand-ins for the collaborators of the sync engine. Nothing happens until a test says so.

#include <common/typedefs.h>
#include <sync/debug_session.h>
#include <sync/notifier.h>
#include <sync/timer_service.h>
#include <sync/viewer_transport.h>

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace dapsync::test {

class FakeTimerService final : public sync::TimerService
{
public:
  struct Timer
  {
    std::chrono::milliseconds mDeadline;
    std::function<void()> mTask;
  };

  TimerId
  ScheduleAfter(std::chrono::milliseconds delay, std::function<void()> task) noexcept final
  {
    const auto id = mNextId++;
    mTimers.emplace(id, Timer{ mNow + delay, std::move(task) });
    mLastDelay = delay;
    ++mScheduledCount;
    return id;
  }

  bool
  Cancel(TimerId id) noexcept final
  {
    ++mCancelCount;
    return mTimers.erase(id) > 0;
  }

  // Move the clock forward, firing every timer that comes due, in deadline order.
  u32
  Advance(std::chrono::milliseconds by)
  {
    const auto target = mNow + by;
    u32 fired = 0;
    while (true) {
      auto next = std::min_element(mTimers.begin(), mTimers.end(), [](const auto &a, const auto &b) {
        return a.second.mDeadline < b.second.mDeadline;
      });
      if (next == mTimers.end() || next->second.mDeadline > target) {
        break;
      }
      mNow = next->second.mDeadline;
      auto task = std::move(next->second.mTask);
      mTimers.erase(next);
      task();
      ++fired;
    }
    mNow = target;
    return fired;
  }

  u32
  Armed() const
  {
    return static_cast<u32>(mTimers.size());
  }

  std::chrono::milliseconds mNow{ 0 };
  std::chrono::milliseconds mLastDelay{ 0 };
  u32 mScheduledCount{ 0 };
  u32 mCancelCount{ 0 };

private:
  TimerId mNextId{ 1 };
  std::map<TimerId, Timer> mTimers{};
};

class FakeTransport final : public sync::ViewerTransport
{
public:
  struct Request
  {
    sync::ViewerEndpoint mEndpoint;
    std::string mAddress;
    std::function<void(sync::TransportResult)> mOnComplete;
  };

  void
  PostGoto(const sync::ViewerEndpoint &endpoint, std::string address,
           std::function<void(sync::TransportResult)> onComplete) noexcept final
  {
    mSent.push_back(address);
    mEndpoints.push_back(endpoint);
    mInFlight.push_back(Request{ endpoint, std::move(address), std::move(onComplete) });
  }

  // Complete the oldest request in flight.
  void
  Complete(sync::TransportResult result)
  {
    ASSERT_FALSE(mInFlight.empty());
    auto request = std::move(mInFlight.front());
    mInFlight.pop_front();
    request.mOnComplete(std::move(result));
  }

  // Complete the newest request in flight.
  void
  CompleteLatest(sync::TransportResult result)
  {
    ASSERT_FALSE(mInFlight.empty());
    auto request = std::move(mInFlight.back());
    mInFlight.pop_back();
    request.mOnComplete(std::move(result));
  }

  void
  Succeed()
  {
    Complete(u16{ 200 });
  }

  void
  Refuse()
  {
    Complete(std::unexpected(
      sync::TransportError{ .mKind = sync::TransportError::Kind::Connect, .mMessage = "refused", .mErrno = 111 }));
  }

  u32
  InFlight() const
  {
    return static_cast<u32>(mInFlight.size());
  }

  std::vector<std::string> mSent{};
  std::vector<sync::ViewerEndpoint> mEndpoints{};
  std::deque<Request> mInFlight{};
};

class FakeNotifier final : public sync::UserNotifier
{
public:
  void
  Notify(sync::Severity severity, std::string_view message) noexcept final
  {
    mMessages.emplace_back(severity, std::string{ message });
  }

  u32
  Count(sync::Severity severity) const
  {
    return static_cast<u32>(std::ranges::count_if(mMessages, [severity](const auto &m) {
      return m.first == severity;
    }));
  }

  std::vector<std::pair<sync::Severity, std::string>> mMessages{};
};

class FakeSessionHost final : public sync::DebugSessionHost
{
public:
  struct Evaluation
  {
    std::string mExpression;
    sync::FrameInfo mFrame;
    std::function<void(sync::EvaluateResult)> mOnResult;
  };

  explicit FakeSessionHost(SessionId id) : mId(id) {}

  SessionId
  GetSessionId() const noexcept final
  {
    return mId;
  }

  Option<sync::FrameInfo>
  CurrentFrame() const noexcept final
  {
    return mCurrentFrame;
  }

  void
  Evaluate(std::string expression, const sync::FrameInfo &frame,
           std::function<void(sync::EvaluateResult)> onResult) noexcept final
  {
    mEvaluated.push_back(expression);
    mPending.push_back(Evaluation{ std::move(expression), frame, std::move(onResult) });
  }

  // Answer the oldest outstanding evaluation of `expression`. Returns false if there is none.
  bool
  Respond(std::string_view expression, sync::EvaluateResult result)
  {
    auto it = std::ranges::find_if(mPending, [expression](const auto &e) { return e.mExpression == expression; });
    if (it == mPending.end()) {
      return false;
    }
    auto evaluation = std::move(*it);
    mPending.erase(it);
    evaluation.mOnResult(std::move(result));
    return true;
  }

  bool
  Fail(std::string_view expression)
  {
    return Respond(expression, std::unexpected(sync::EvaluateError{ .mMessage = "invalid register" }));
  }

  u32
  Outstanding() const
  {
    return static_cast<u32>(mPending.size());
  }

  SessionId mId;
  Option<sync::FrameInfo> mCurrentFrame{};
  std::vector<std::string> mEvaluated{};
  std::vector<Evaluation> mPending{};
};

inline sync::FrameInfo
TopFrame(i64 frameId = 1)
{
  return sync::FrameInfo{ .mIndex = 0, .mFrameId = frameId, .mInstructionPointerReference = std::nullopt };
}

inline sync::FrameInfo
OuterFrame(u32 index, Option<std::string> ipRef, i64 frameId = 100)
{
  return sync::FrameInfo{ .mIndex = index, .mFrameId = frameId, .mInstructionPointerReference = std::move(ipRef) };
}

} // namespace dapsync::test
