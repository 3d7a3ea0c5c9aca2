/** LICENSE TEMPLATE */
#include "sync_engine.h"

// dapsync
#include <sync/address.h>
#include <utils/logger.h>

namespace dapsync::sync {

SyncEngine::SyncEngine(DebugSessionHost &host, AddressForwarder &forwarder, TimerService &timers,
                       UserNotifier &notifier, const cfg::SyncConfiguration &config, bool enabled) noexcept
    : mHost(host), mForwarder(forwarder), mConfig(config), mState(std::make_shared<SyncState>()),
      mResolver(notifier), mReporter(notifier),
      mRetry(timers, *mState, config.mRetryInterval,
        [this](std::string address, u64 sequence) { Forward(std::move(address), sequence); })
{
  mState->mEnabled = enabled;
  DBGLOG(sync, "[session {}]: sync engine created, enabled={}", mHost.GetSessionId(), enabled);
}

SyncEngine::~SyncEngine() noexcept
{
  DBGLOG(sync, "[session {}]: sync engine destroyed", mHost.GetSessionId());
}

void
SyncEngine::OnStopped() noexcept
{
  if (!mState->mEnabled) {
    return;
  }
  // A stop without a known frame still means "innermost frame": evaluate without a frame id.
  const auto frame = mHost.CurrentFrame().value_or(FrameInfo{ .mIndex = 0 });
  SyncFrame(frame);
}

void
SyncEngine::OnFrameSelected(const FrameInfo &frame) noexcept
{
  SyncFrame(frame);
}

SyncOutcome
SyncEngine::SyncFrame(const FrameInfo &frame, bool ignoreEnabled) noexcept
{
  if (!mState->mEnabled && !ignoreEnabled) {
    return SyncOutcome::Disabled;
  }

  if (frame.mIndex == 0) {
    mResolver.ResolveProgramCounter(
      mHost, frame, mState, mConfig.mRegisterCandidates, [this, ignoreEnabled](std::string value) {
        // The resolver only calls back while mState, and therefore this engine, is alive.
        if (!mState->mEnabled && !ignoreEnabled) {
          DBGLOG(sync, "[session {}]: pc {} resolved after sync was disabled, dropped", GetSessionId(), value);
          return;
        }
        SyncAddress(value);
      });
    return SyncOutcome::ReadRegister;
  }

  if (frame.mInstructionPointerReference) {
    SyncAddress(*frame.mInstructionPointerReference);
    return SyncOutcome::DirectAddress;
  }

  DBGLOG(sync, "[session {}]: frame #{} has no instruction pointer reference", GetSessionId(), frame.mIndex);
  return SyncOutcome::NothingToSync;
}

void
SyncEngine::SyncAddress(std::string_view address) noexcept
{
  const auto sequence = mState->mNextSequence++;
  std::string canonical{ CanonicalAddress(address) };
  // A retry still waiting for its timer must not resend something older than this.
  mRetry.Supersede(canonical, sequence);
  Forward(std::move(canonical), sequence);
}

void
SyncEngine::Forward(std::string address, u64 sequence) noexcept
{
  DBGLOG(sync, "[session {}]: forward {} (#{})", GetSessionId(), address, sequence);
  mForwarder.Forward(address,
    [this, weakState = std::weak_ptr{ mState }, epoch = mState->mForwardEpoch, address, sequence](bool success) {
      auto state = weakState.lock();
      if (!state || state->mForwardEpoch != epoch) {
        DBGLOG(sync, "result for {} (#{}) arrived after reset, dropped", address, sequence);
        return;
      }
      OnForwardResult(address, sequence, success);
    });
}

void
SyncEngine::OnForwardResult(const std::string &address, u64 sequence, bool success) noexcept
{
  auto &state = *mState;
  if (success) {
    state.mLastDeliveredSequence = std::max(state.mLastDeliveredSequence, sequence);
    ConnectionFailureReporter::Clear(state);
    if (state.mPendingAddress && state.mPendingSequence <= sequence) {
      mRetry.Discard();
    }
    DBGLOG(sync, "[session {}]: viewer is at {} (#{})", GetSessionId(), address, sequence);
    return;
  }

  if (sequence < state.mLastDeliveredSequence) {
    DBGLOG(sync, "[session {}]: {} (#{}) failed but a newer address was delivered", GetSessionId(), address,
      sequence);
    return;
  }

  mReporter.ReportFailure(state, mConfig);

  if (!state.mEnabled) {
    DBGLOG(sync, "[session {}]: not retrying {}, sync is disabled", GetSessionId(), address);
    return;
  }

  if (state.mPendingAddress && state.mPendingSequence > sequence) {
    // A newer address is already waiting. It is the one to retry.
    mRetry.EnsureArmed();
    return;
  }

  mRetry.ScheduleRetry(address, sequence);
}

void
SyncEngine::SetEnabled(bool enabled) noexcept
{
  mState->mEnabled = enabled;
  if (!enabled) {
    mRetry.Discard();
  }
}

bool
SyncEngine::IsEnabled() const noexcept
{
  return mState->mEnabled;
}

void
SyncEngine::Reset() noexcept
{
  DBGLOG(sync, "[session {}]: reset", GetSessionId());
  mRetry.Discard();
  mState->mFailureEpisodeActive = false;
  mState->mDetectedRegister.reset();
  ++mState->mSessionEpoch;
  ++mState->mForwardEpoch;
}

void
SyncEngine::OnConfigurationReplaced() noexcept
{
  mRetry.Discard();
  ConnectionFailureReporter::Clear(*mState);
  mRetry.SetInterval(mConfig.mRetryInterval);
  ++mState->mForwardEpoch;
}

const SyncState &
SyncEngine::State() const noexcept
{
  return *mState;
}

SessionId
SyncEngine::GetSessionId() const noexcept
{
  return mHost.GetSessionId();
}

} // namespace dapsync::sync
