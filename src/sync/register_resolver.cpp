/** LICENSE TEMPLATE */
#include "register_resolver.h"

// dapsync
#include <utils/logger.h>

// fmt
#include <fmt/core.h>

namespace dapsync::sync {

// Shared by every read of one detection race. Once a winner is recorded, later completions are ignored.
struct DetectionRace
{
  bool mWinnerRecorded{ false };
};

static std::string
RegisterExpression(std::string_view registerName) noexcept
{
  return fmt::format("${}", registerName);
}

RegisterResolver::RegisterResolver(UserNotifier &notifier) noexcept : mNotifier(notifier) {}

void
RegisterResolver::ResolveProgramCounter(DebugSessionHost &host, const FrameInfo &frame,
                                        const std::shared_ptr<SyncState> &state,
                                        std::span<const std::string> candidates, OnFound onFound) noexcept
{
  if (state->mDetectedRegister) {
    ReadCachedRegister(host, frame, state, std::move(onFound));
  } else {
    RaceCandidates(host, frame, state, candidates, std::move(onFound));
  }
}

void
RegisterResolver::ReadCachedRegister(DebugSessionHost &host, const FrameInfo &frame,
                                     const std::shared_ptr<SyncState> &state, OnFound onFound) noexcept
{
  const std::string registerName = *state->mDetectedRegister;
  DBGLOG(sync, "[session {}]: reading cached pc register {}", host.GetSessionId(), registerName);
  host.Evaluate(RegisterExpression(registerName), frame,
    [weakState = std::weak_ptr{ state }, epoch = state->mSessionEpoch, registerName,
      onFound = std::move(onFound)](EvaluateResult result) {
      auto state = weakState.lock();
      if (!state || state->mSessionEpoch != epoch) {
        return;
      }
      if (!result) {
        DBGLOG(sync, "reading {} failed, skipping this event: {}", registerName, result.error().mMessage);
        return;
      }
      onFound(std::move(result.value()));
    });
}

void
RegisterResolver::RaceCandidates(DebugSessionHost &host, const FrameInfo &frame,
                                 const std::shared_ptr<SyncState> &state, std::span<const std::string> candidates,
                                 OnFound onFound) noexcept
{
  if (candidates.empty()) {
    DBGLOG(warning, "[session {}]: no register candidates configured, nothing to detect", host.GetSessionId());
    return;
  }

  DBGLOG(sync, "[session {}]: detecting pc register among {} candidates", host.GetSessionId(), candidates.size());
  auto race = std::make_shared<DetectionRace>();
  // Every candidate callback needs to be able to deliver the value, but only one will.
  auto sharedOnFound = std::make_shared<OnFound>(std::move(onFound));
  const auto epoch = state->mSessionEpoch;
  const std::weak_ptr<SyncState> weakState = state;
  UserNotifier *notifier = &mNotifier;

  for (const auto &candidate : candidates) {
    host.Evaluate(RegisterExpression(candidate), frame,
      [weakState, epoch, race, sharedOnFound, notifier, candidate](EvaluateResult result) {
        auto state = weakState.lock();
        if (!state || state->mSessionEpoch != epoch || race->mWinnerRecorded) {
          return;
        }
        if (!result) {
          DBGLOG(sync, "candidate {} did not evaluate: {}", candidate, result.error().mMessage);
          return;
        }
        race->mWinnerRecorded = true;

        // An overlapping race of the same session may have finished first. Detection happens once per session,
        // so the earlier winner stays cached.
        if (!state->mDetectedRegister) {
          state->mDetectedRegister = candidate;
          DBGLOG(sync, "detected pc register {}", candidate);
          notifier->Notify(Severity::Info, fmt::format("Detected PC register: {}", candidate));
        }
        (*sharedOnFound)(std::move(result.value()));
      });
  }
}

} // namespace dapsync::sync
