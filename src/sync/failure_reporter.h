/** LICENSE TEMPLATE */
#pragma once

// dapsync
#include <configuration/config.h>
#include <sync/notifier.h>
#include <sync/sync_state.h>

// std
#include <string>

namespace dapsync::sync {

// Tells the user about an unreachable viewer once per failure episode.
class ConnectionFailureReporter
{
  UserNotifier &mNotifier;

public:
  explicit ConnectionFailureReporter(UserNotifier &notifier) noexcept;

  // Warns only on the transition into a failure episode. Returns true if it did.
  bool ReportFailure(SyncState &state, const cfg::SyncConfiguration &config) noexcept;
  // Ends the failure episode. The next failure warns again.
  static void Clear(SyncState &state) noexcept;

  static std::string FormatFailureMessage(const cfg::SyncConfiguration &config) noexcept;
};

} // namespace dapsync::sync
