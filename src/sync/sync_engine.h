/** LICENSE TEMPLATE */
#pragma once

// dapsync
#include <common/macros.h>
#include <configuration/config.h>
#include <sync/address_forwarder.h>
#include <sync/debug_session.h>
#include <sync/failure_reporter.h>
#include <sync/notifier.h>
#include <sync/register_resolver.h>
#include <sync/retry_scheduler.h>
#include <sync/sync_state.h>
#include <sync/timer_service.h>

// std
#include <memory>
#include <string>
#include <string_view>

namespace dapsync::sync {

// What SyncFrame decided to do with a frame.
enum class SyncOutcome : u8
{
  Disabled,
  ReadRegister,
  DirectAddress,
  NothingToSync
};

// Keeps the viewer on the address of one debugging session's selected frame.
class SyncEngine
{
public:
  NO_COPY(SyncEngine);
  SyncEngine(DebugSessionHost &host, AddressForwarder &forwarder, TimerService &timers, UserNotifier &notifier,
             const cfg::SyncConfiguration &config, bool enabled) noexcept;
  ~SyncEngine() noexcept;

  // The debuggee stopped. Syncs the host's current frame, which is the innermost one.
  void OnStopped() noexcept;
  // The user selected another frame.
  void OnFrameSelected(const FrameInfo &frame) noexcept;

  // Frame 0 is synced by reading the program counter; other frames by their instruction pointer reference.
  // `ignoreEnabled` is for explicit user requests, which sync even while synchronization is off.
  SyncOutcome SyncFrame(const FrameInfo &frame, bool ignoreEnabled = false) noexcept;
  // Forward `address` now. The newest address always wins over any earlier one still pending.
  void SyncAddress(std::string_view address) noexcept;

  void SetEnabled(bool enabled) noexcept;
  bool IsEnabled() const noexcept;

  // Session is over: drop the pending address, the retry timer, the failure episode and the detected register.
  void Reset() noexcept;
  // The configuration was replaced: drop retry and failure state. The detected register and the enabled flag
  // stay.
  void OnConfigurationReplaced() noexcept;

  const SyncState &State() const noexcept;
  SessionId GetSessionId() const noexcept;

private:
  void Forward(std::string address, u64 sequence) noexcept;
  void OnForwardResult(const std::string &address, u64 sequence, bool success) noexcept;

  DebugSessionHost &mHost;
  AddressForwarder &mForwarder;
  const cfg::SyncConfiguration &mConfig;
  std::shared_ptr<SyncState> mState;
  RegisterResolver mResolver;
  ConnectionFailureReporter mReporter;
  RetryScheduler mRetry;
};

} // namespace dapsync::sync
