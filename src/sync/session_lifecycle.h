/** LICENSE TEMPLATE */
#pragma once

// dapsync
#include <common/macros.h>
#include <configuration/config.h>
#include <sync/address_forwarder.h>
#include <sync/debug_session.h>
#include <sync/notifier.h>
#include <sync/sync_engine.h>
#include <sync/timer_service.h>

// std
#include <map>
#include <memory>

namespace dapsync::sync {

// Owns the configuration, the global enabled flag and one SyncEngine per live debugging session. Everything
// the user can ask for (toggle, manual sync, script path, reconfigure) goes through here.
class SessionLifecycle
{
public:
  NO_COPY(SessionLifecycle);
  SessionLifecycle(ViewerTransport &transport, TimerService &timers, UserNotifier &notifier,
                   cfg::SyncConfiguration config) noexcept;
  ~SessionLifecycle() noexcept;

  // `host` must outlive the session, i.e. until OnSessionTerminated for its id returns.
  SyncEngine *OnSessionStarted(DebugSessionHost &host) noexcept;
  // Idempotent. Unknown ids are ignored.
  void OnSessionTerminated(SessionId sessionId) noexcept;

  void OnStopped(SessionId sessionId) noexcept;
  void OnFrameSelected(SessionId sessionId, const FrameInfo &frame) noexcept;

  // Returns the new state.
  bool Toggle() noexcept;
  // Turning sync on with an active session syncs its current frame right away. Turning it off drops pending
  // retries but keeps detected registers and failure episodes.
  void SetEnabled(bool enabled) noexcept;
  bool IsEnabled() const noexcept;

  // Sync the active session's selected frame, telling the user why when that is not possible.
  void SyncCurrentFrame() noexcept;
  // Reports the companion script path to the user and returns it.
  Path ReportScriptPath() noexcept;
  // Replace the configuration wholesale. Every live session drops its retry and failure state.
  void ReplaceConfiguration(cfg::SyncConfiguration config) noexcept;

  const cfg::SyncConfiguration &Configuration() const noexcept;
  SyncEngine *GetEngine(SessionId sessionId) noexcept;
  SyncEngine *ActiveEngine() noexcept;
  u32 SessionCount() const noexcept;

private:
  cfg::SyncConfiguration mConfig;
  AddressForwarder mForwarder;
  TimerService &mTimers;
  UserNotifier &mNotifier;
  bool mEnabled;
  std::map<SessionId, std::unique_ptr<SyncEngine>> mEngines{};
  // The session user commands apply to: the most recently started one that is still alive.
  Option<SessionId> mActiveSession{};
  std::map<SessionId, DebugSessionHost *> mHosts{};
};

} // namespace dapsync::sync
