/** LICENSE TEMPLATE */
#pragma once

// dapsync
#include <sync/debug_session.h>
#include <sync/notifier.h>
#include <sync/sync_state.h>

// std
#include <functional>
#include <memory>
#include <span>
#include <string>

namespace dapsync::sync {

// Finds out which register holds the program counter and reads it.
class RegisterResolver
{
  UserNotifier &mNotifier;

public:
  using OnFound = std::function<void(std::string value)>;

  explicit RegisterResolver(UserNotifier &notifier) noexcept;

  // With a register already detected for this session, read only that one. Otherwise read every candidate at
  // once; the first read to *complete* successfully decides which register is cached for the session. The
  // remaining reads are disregarded when they come back.
  //
  // `onFound` is called at most once. A failed read, or no candidate producing a value, means no call. A failed
  // read of the cached register does not invalidate it.
  void ResolveProgramCounter(DebugSessionHost &host, const FrameInfo &frame,
                             const std::shared_ptr<SyncState> &state, std::span<const std::string> candidates,
                             OnFound onFound) noexcept;

private:
  void ReadCachedRegister(DebugSessionHost &host, const FrameInfo &frame, const std::shared_ptr<SyncState> &state,
                          OnFound onFound) noexcept;
  void RaceCandidates(DebugSessionHost &host, const FrameInfo &frame, const std::shared_ptr<SyncState> &state,
                      std::span<const std::string> candidates, OnFound onFound) noexcept;
};

} // namespace dapsync::sync
