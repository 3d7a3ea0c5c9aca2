/** LICENSE TEMPLATE */
#pragma once

// dapsync
#include <common/typedefs.h>

// std
#include <string>

namespace dapsync::sync {

// Per-session synchronization state. Owned by exactly one SyncEngine and only touched on the control thread.
// Asynchronous completions hold a weak reference plus the epoch they were started in; a mismatch means the state
// they were meant for is gone and the result is dropped.
struct SyncState
{
  bool mEnabled{ false };
  Option<std::string> mDetectedRegister{};
  bool mFailureEpisodeActive{ false };
  // Latest address that has not yet been delivered. Last write wins.
  Option<std::string> mPendingAddress{};
  // Sequence number of mPendingAddress. Orders forwards so that an older completion never clears newer state.
  u64 mPendingSequence{ 0 };
  // Set iff mPendingAddress is set and a retry timer is armed.
  Option<TimerId> mPendingRetryHandle{};

  u64 mNextSequence{ 1 };
  // Highest sequence number the viewer has acknowledged. Failures of anything at or below it are moot.
  u64 mLastDeliveredSequence{ 0 };
  // Bumped on session reset. Stale register reads are dropped.
  u64 mSessionEpoch{ 0 };
  // Bumped on session reset and reconfiguration. Stale forward completions are dropped.
  u64 mForwardEpoch{ 0 };

  // True when nothing session-scoped is left: no register, no pending address, no timer, no failure episode.
  bool
  IsEmpty() const noexcept
  {
    return !mDetectedRegister && !mFailureEpisodeActive && !mPendingAddress && !mPendingRetryHandle;
  }
};

} // namespace dapsync::sync
