/** LICENSE TEMPLATE */
#include "session_lifecycle.h"

// dapsync
#include <utils/logger.h>

// fmt
#include <fmt/core.h>

namespace dapsync::sync {

static ViewerEndpoint
EndpointOf(const cfg::SyncConfiguration &config) noexcept
{
  return ViewerEndpoint{ .mHost = config.mViewerHost, .mPort = config.mViewerPort };
}

SessionLifecycle::SessionLifecycle(ViewerTransport &transport, TimerService &timers, UserNotifier &notifier,
                                   cfg::SyncConfiguration config) noexcept
    : mConfig(std::move(config)), mForwarder(transport, EndpointOf(mConfig)), mTimers(timers),
      mNotifier(notifier), mEnabled(mConfig.mAutoEnable)
{
}

SessionLifecycle::~SessionLifecycle() noexcept
{
  for (auto &[id, engine] : mEngines) {
    engine->Reset();
  }
}

SyncEngine *
SessionLifecycle::OnSessionStarted(DebugSessionHost &host) noexcept
{
  const auto id = host.GetSessionId();
  if (auto it = mEngines.find(id); it != std::end(mEngines)) {
    DBGLOG(warning, "session {} started twice, keeping the existing engine", id);
    return it->second.get();
  }

  DBGLOG(sync, "session {} started, sync {}", id, mEnabled ? "enabled" : "disabled");
  auto [it, _] = mEngines.emplace(
    id, std::make_unique<SyncEngine>(host, mForwarder, mTimers, mNotifier, mConfig, mEnabled));
  mHosts[id] = &host;
  mActiveSession = id;
  return it->second.get();
}

void
SessionLifecycle::OnSessionTerminated(SessionId sessionId) noexcept
{
  auto it = mEngines.find(sessionId);
  if (it == std::end(mEngines)) {
    return;
  }
  DBGLOG(sync, "session {} terminated", sessionId);
  it->second->Reset();
  mEngines.erase(it);
  mHosts.erase(sessionId);
  if (mActiveSession == sessionId) {
    mActiveSession = mEngines.empty() ? Option<SessionId>{} : Option<SessionId>{ mEngines.rbegin()->first };
  }
}

void
SessionLifecycle::OnStopped(SessionId sessionId) noexcept
{
  if (auto engine = GetEngine(sessionId); engine) {
    mActiveSession = sessionId;
    engine->OnStopped();
  }
}

void
SessionLifecycle::OnFrameSelected(SessionId sessionId, const FrameInfo &frame) noexcept
{
  if (auto engine = GetEngine(sessionId); engine) {
    mActiveSession = sessionId;
    engine->OnFrameSelected(frame);
  }
}

bool
SessionLifecycle::Toggle() noexcept
{
  SetEnabled(!mEnabled);
  return mEnabled;
}

void
SessionLifecycle::SetEnabled(bool enabled) noexcept
{
  mEnabled = enabled;
  DBGLOG(sync, "sync {}", enabled ? "enabled" : "disabled");
  for (auto &[id, engine] : mEngines) {
    engine->SetEnabled(enabled);
  }

  if (enabled && ActiveEngine() != nullptr) {
    SyncCurrentFrame();
  }
}

bool
SessionLifecycle::IsEnabled() const noexcept
{
  return mEnabled;
}

void
SessionLifecycle::SyncCurrentFrame() noexcept
{
  auto engine = ActiveEngine();
  if (!engine) {
    mNotifier.Notify(Severity::Warning, "No active DAP session");
    return;
  }

  const auto frame = mHosts[*mActiveSession]->CurrentFrame();
  if (!frame) {
    mNotifier.Notify(Severity::Warning, "No current frame");
    return;
  }

  if (engine->SyncFrame(*frame, /* ignoreEnabled */ true) == SyncOutcome::NothingToSync) {
    mNotifier.Notify(Severity::Warning, "Cannot determine frame address");
  }
}

Path
SessionLifecycle::ReportScriptPath() noexcept
{
  auto path = mConfig.CompanionScriptPath();
  mNotifier.Notify(Severity::Info, fmt::format("Ghidra script: {}", path.c_str()));
  return path;
}

void
SessionLifecycle::ReplaceConfiguration(cfg::SyncConfiguration config) noexcept
{
  DBGLOG(sync, "configuration replaced: viewer {}:{}, retry every {}ms", config.mViewerHost, config.mViewerPort,
    config.mRetryInterval.count());
  mConfig = std::move(config);
  mForwarder.SetEndpoint(EndpointOf(mConfig));
  for (auto &[id, engine] : mEngines) {
    engine->OnConfigurationReplaced();
  }
}

const cfg::SyncConfiguration &
SessionLifecycle::Configuration() const noexcept
{
  return mConfig;
}

SyncEngine *
SessionLifecycle::GetEngine(SessionId sessionId) noexcept
{
  if (auto it = mEngines.find(sessionId); it != std::end(mEngines)) {
    return it->second.get();
  }
  return nullptr;
}

SyncEngine *
SessionLifecycle::ActiveEngine() noexcept
{
  return mActiveSession ? GetEngine(*mActiveSession) : nullptr;
}

u32
SessionLifecycle::SessionCount() const noexcept
{
  return static_cast<u32>(mEngines.size());
}

} // namespace dapsync::sync
