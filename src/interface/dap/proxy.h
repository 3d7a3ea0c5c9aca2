/** LICENSE TEMPLATE */
#pragma once
// dapsync
#include <common/macros.h>
#include <configuration/config.h>
#include <interface/dap/connection.h>
#include <interface/dap/custom_commands.h>
#include <interface/dap/dap_session_host.h>
#include <interface/dap/protocol.h>
#include <sync/notifier.h>
#include <sync/session_lifecycle.h>
#include <sync/timer_service.h>
#include <sync/viewer_transport.h>

// std
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace dapsync::ui::dap {

// Sits between a DAP client and a debug adapter. Traffic is relayed unchanged in both directions while the
// proxy watches it for the things address synchronization cares about (sessions starting and ending, stops,
// stack frames, frame selection). It answers the dapsync* custom requests itself and injects requests of its own
// towards the adapter, whose responses it keeps to itself.
//
// Everything here runs on the control thread.
class DapProxy final : public sync::UserNotifier, public AdapterRequester
{
public:
  using OnShutdown = std::function<void()>;

  NO_COPY(DapProxy);
  DapProxy(sync::ViewerTransport &transport, sync::TimerService &timers, cfg::SyncConfiguration configuration,
           MessageWriter &client, MessageWriter &adapter, OnShutdown onShutdown) noexcept;
  ~DapProxy() noexcept override;

  void OnClientMessage(std::string payload) noexcept;
  void OnAdapterMessage(std::string payload) noexcept;
  // Client went away. Nothing left to relay for.
  void OnClientClosed() noexcept;
  // Adapter exited or closed its stdout. Ends the current session.
  void OnAdapterClosed() noexcept;

  void Notify(sync::Severity severity, std::string_view message) noexcept final;
  void SendRequest(std::string_view command, Dict arguments, ResponseHandler onResponse) noexcept final;

  sync::SessionLifecycle &Lifecycle() noexcept;
  DapSessionHost *CurrentSession() noexcept;
  u32 PendingInjectedRequests() const noexcept;

private:
  void HandleClientRequest(const Dict &request, const std::string &payload) noexcept;
  void HandleAdapterResponse(const Dict &response, const std::string &payload) noexcept;
  void HandleAdapterEvent(const Dict &event) noexcept;

  void StartSession() noexcept;
  void EndSession() noexcept;
  void OnStoppedEvent(const Dict &event) noexcept;
  void OnStackTraceForStop(SessionId sessionId, u64 generation, const Dict &response) noexcept;
  void SelectFrame(i64 frameId) noexcept;

  void RespondToCustomCommand(CustomCommand command, const Dict &request) noexcept;
  void SendToClient(const Dict &message) noexcept;
  void Shutdown() noexcept;

  MessageWriter &mClient;
  MessageWriter &mAdapter;
  OnShutdown mOnShutdown;
  // The configuration the process started with. Runtime reconfiguration merges over this.
  cfg::SyncConfiguration mBaseConfiguration;
  sync::SessionLifecycle mLifecycle;

  UniquePtr<DapSessionHost> mSession{ nullptr };
  SessionId mNextSessionId{ 1 };

  // Requests we injected, by seq, waiting for the adapter's response.
  std::unordered_map<i64, ResponseHandler> mInjectedRequests{};
  // Client `stackTrace` requests in flight, by seq, with their `startFrame`.
  std::unordered_map<i64, u32> mClientStackTraces{};
  i64 mNextAdapterSeq{ kInjectedSequenceStart };
  i64 mNextClientSeq{ kInjectedSequenceStart };
  bool mShutdown{ false };
};

} // namespace dapsync::ui::dap
