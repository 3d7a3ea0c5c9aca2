/** LICENSE TEMPLATE */
#include "failure_reporter.h"

// dapsync
#include <utils/logger.h>

// fmt
#include <fmt/core.h>

namespace dapsync::sync {

ConnectionFailureReporter::ConnectionFailureReporter(UserNotifier &notifier) noexcept : mNotifier(notifier) {}

/* static */
std::string
ConnectionFailureReporter::FormatFailureMessage(const cfg::SyncConfiguration &config) noexcept
{
  const auto intervalMs = config.mRetryInterval.count();
  const auto interval =
    intervalMs % 1000 == 0 ? fmt::format("{}s", intervalMs / 1000) : fmt::format("{}ms", intervalMs);

  return fmt::format("Failed to connect to Ghidra server at {}:{}\n\n"
                     "To start the Ghidra server:\n"
                     "1. Open Ghidra Script Manager (Window > Script Manager)\n"
                     "2. Run script: {}\n\n"
                     "Retrying silently every {}...",
    config.mViewerHost,
    config.mViewerPort,
    config.CompanionScriptPath().c_str(),
    interval);
}

bool
ConnectionFailureReporter::ReportFailure(SyncState &state, const cfg::SyncConfiguration &config) noexcept
{
  if (state.mFailureEpisodeActive) {
    DBGLOG(sync, "viewer still unreachable, failure episode already reported");
    return false;
  }
  state.mFailureEpisodeActive = true;
  DBGLOG(sync, "failure episode started for {}:{}", config.mViewerHost, config.mViewerPort);
  mNotifier.Notify(Severity::Warning, FormatFailureMessage(config));
  return true;
}

/* static */
void
ConnectionFailureReporter::Clear(SyncState &state) noexcept
{
  if (state.mFailureEpisodeActive) {
    DBGLOG(sync, "failure episode over");
  }
  state.mFailureEpisodeActive = false;
}

} // namespace dapsync::sync
