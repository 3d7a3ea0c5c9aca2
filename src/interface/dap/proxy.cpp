/** LICENSE TEMPLATE */
#include "proxy.h"

// dapsync
#include <utils/logger.h>

// std
#include <algorithm>
#include <array>

namespace dapsync::ui::dap {

using namespace std::string_view_literals;

// Requests after which the frame ids the adapter handed out are no longer valid.
static constexpr std::array kResumeCommands = { "continue"sv, "next"sv, "stepIn"sv, "stepOut"sv, "stepBack"sv,
  "reverseContinue"sv, "goto"sv, "restartFrame"sv, "restart"sv };

static bool
IsResumeCommand(std::string_view command) noexcept
{
  return std::ranges::find(kResumeCommands, command) != std::end(kResumeCommands);
}

DapProxy::DapProxy(sync::ViewerTransport &transport, sync::TimerService &timers,
                   cfg::SyncConfiguration configuration, MessageWriter &client, MessageWriter &adapter,
                   OnShutdown onShutdown) noexcept
    : mClient(client), mAdapter(adapter), mOnShutdown(std::move(onShutdown)), mBaseConfiguration(configuration),
      mLifecycle(transport, timers, *this, std::move(configuration))
{
}

DapProxy::~DapProxy() noexcept { EndSession(); }

void
DapProxy::OnClientMessage(std::string payload) noexcept
{
  const auto message = ParseProtocolMessage(payload);
  if (message && GetString(*message, "type") == "request") {
    HandleClientRequest(*message, payload);
    return;
  }
  // Responses to reverse requests, or something we don't understand. Not ours to judge.
  mAdapter.WriteMessage(payload);
}

void
DapProxy::OnAdapterMessage(std::string payload) noexcept
{
  const auto message = ParseProtocolMessage(payload);
  if (!message) {
    mClient.WriteMessage(payload);
    return;
  }

  const auto type = GetString(*message, "type");
  if (type == "response") {
    HandleAdapterResponse(*message, payload);
    return;
  }

  mClient.WriteMessage(payload);
  if (type == "event") {
    HandleAdapterEvent(*message);
  }
}

void
DapProxy::HandleClientRequest(const Dict &request, const std::string &payload) noexcept
{
  const auto command = GetString(request, "command").value_or("");
  if (const auto custom = ParseCustomCommand(command); custom) {
    RespondToCustomCommand(*custom, request);
    return;
  }

  const auto seq = GetInteger(request, "seq");
  const Dict *arguments = GetObject(request, "arguments");
  if (command == "stackTrace" && seq) {
    const auto startFrame = arguments ? GetInteger(*arguments, "startFrame").value_or(0) : 0;
    mClientStackTraces[*seq] = static_cast<u32>(std::max<i64>(startFrame, 0));
  }

  mAdapter.WriteMessage(payload);

  if (command == "scopes" && arguments != nullptr) {
    if (const auto frameId = GetInteger(*arguments, "frameId"); frameId) {
      SelectFrame(*frameId);
    }
  } else if (IsResumeCommand(command) && mSession) {
    mSession->ClearFrames();
  }
}

void
DapProxy::HandleAdapterResponse(const Dict &response, const std::string &payload) noexcept
{
  const auto requestSeq = GetInteger(response, "request_seq");
  if (requestSeq) {
    if (auto it = mInjectedRequests.find(*requestSeq); it != std::end(mInjectedRequests)) {
      auto handler = std::move(it->second);
      mInjectedRequests.erase(it);
      handler(response);
      return;
    }
    if (*requestSeq >= kInjectedSequenceStart) {
      DBGLOG(dap, "dropping response to unknown injected request {}", *requestSeq);
      return;
    }
    if (auto it = mClientStackTraces.find(*requestSeq); it != std::end(mClientStackTraces)) {
      const auto startFrame = it->second;
      mClientStackTraces.erase(it);
      const Dict *body = GetObject(response, "body");
      if (mSession && body != nullptr && GetBoolean(response, "success").value_or(false)) {
        mSession->RecordStackTrace(*body, startFrame);
      }
    }
  }
  mClient.WriteMessage(payload);
}

void
DapProxy::HandleAdapterEvent(const Dict &event) noexcept
{
  const auto name = GetString(event, "event").value_or("");
  if (name == "initialized") {
    StartSession();
  } else if (name == "stopped") {
    OnStoppedEvent(event);
  } else if (name == "continued") {
    if (mSession) {
      mSession->ClearFrames();
    }
  } else if (name == "terminated") {
    EndSession();
  }
}

void
DapProxy::StartSession() noexcept
{
  if (mSession) {
    DBGLOG(dap, "adapter initialized again, ending session {}", mSession->GetSessionId());
    EndSession();
  }
  mSession = std::make_unique<DapSessionHost>(mNextSessionId++, *this);
  DBGLOG(dap, "session {} started", mSession->GetSessionId());
  mLifecycle.OnSessionStarted(*mSession);
}

void
DapProxy::EndSession() noexcept
{
  if (!mSession) {
    return;
  }
  const auto sessionId = mSession->GetSessionId();
  DBGLOG(dap, "session {} ended", sessionId);
  mLifecycle.OnSessionTerminated(sessionId);
  mSession.reset();
  mClientStackTraces.clear();
}

void
DapProxy::OnStoppedEvent(const Dict &event) noexcept
{
  if (!mSession) {
    DBGLOG(dap, "stopped event outside of a session");
    return;
  }
  const auto generation = mSession->ClearFrames();
  const auto sessionId = mSession->GetSessionId();
  const Dict *body = GetObject(event, "body");
  const auto threadId = body != nullptr ? GetInteger(*body, "threadId") : std::nullopt;
  if (!threadId) {
    // Nothing to ask a stack trace for. Registers are then read in whatever the adapter considers current.
    mSession->SetCurrentFrame(sync::FrameInfo{ .mIndex = 0, .mFrameId = {}, .mInstructionPointerReference = {} });
    mLifecycle.OnStopped(sessionId);
    return;
  }

  Dict arguments;
  arguments["threadId"] = *threadId;
  arguments["startFrame"] = 0;
  arguments["levels"] = 1;
  SendRequest("stackTrace", std::move(arguments), [this, sessionId, generation](const Dict &response) {
    OnStackTraceForStop(sessionId, generation, response);
  });
}

void
DapProxy::OnStackTraceForStop(SessionId sessionId, u64 generation, const Dict &response) noexcept
{
  if (!mSession || mSession->GetSessionId() != sessionId || mSession->Generation() != generation) {
    DBGLOG(dap, "stale stack trace for session {} ignored", sessionId);
    return;
  }

  sync::FrameInfo top{ .mIndex = 0, .mFrameId = {}, .mInstructionPointerReference = {} };
  const Dict *body = GetObject(response, "body");
  if (GetBoolean(response, "success").value_or(false) && body != nullptr &&
      mSession->RecordStackTrace(*body, 0) > 0) {
    const Dict *frames = GetArray(*body, "stackFrames");
    if (const auto id = GetInteger(frames->front(), "id"); id) {
      top = mSession->LookupFrame(*id).value_or(top);
    }
  } else {
    DBGLOG(dap, "no stack trace for stop in session {}: {}", sessionId,
           GetString(response, "message").value_or("no frames"));
  }
  mSession->SetCurrentFrame(std::move(top));
  mLifecycle.OnStopped(sessionId);
}

void
DapProxy::SelectFrame(i64 frameId) noexcept
{
  if (!mSession) {
    return;
  }
  const auto frame = mSession->SelectFrame(frameId);
  if (!frame) {
    DBGLOG(dap, "scopes for unknown frame id {}", frameId);
    return;
  }
  mLifecycle.OnFrameSelected(mSession->GetSessionId(), *frame);
}

void
DapProxy::RespondToCustomCommand(CustomCommand command, const Dict &request) noexcept
{
  const auto seq = GetInteger(request, "seq").value_or(0);
  const Dict *arguments = GetObject(request, "arguments");
  auto result =
    ExecuteCustomCommand(command, arguments ? *arguments : Dict::object(), mLifecycle, mBaseConfiguration);
  SendToClient(Response(mNextClientSeq++, seq, result.mSuccess, Enum<CustomCommand>::ToString(command),
                        result.mErrorMessage, std::move(result.mBody)));
}

void
DapProxy::SendToClient(const Dict &message) noexcept
{
  mClient.WriteMessage(Serialize(message));
}

void
DapProxy::Notify(sync::Severity severity, std::string_view message) noexcept
{
  switch (severity) {
  case sync::Severity::Info:
    DBGLOG(sync, "[info] {}", message);
    break;
  case sync::Severity::Warning:
  case sync::Severity::Error:
    DBGLOG(warning, "{}", message);
    break;
  }
  if (mShutdown) {
    return;
  }
  const auto category = severity == sync::Severity::Info ? "console"sv : "important"sv;
  SendToClient(OutputEvent(mNextClientSeq++, category, message));
}

void
DapProxy::SendRequest(std::string_view command, Dict arguments, ResponseHandler onResponse) noexcept
{
  const auto seq = mNextAdapterSeq++;
  mInjectedRequests.emplace(seq, std::move(onResponse));
  if (!mAdapter.WriteMessage(Serialize(Request(seq, command, std::move(arguments))))) {
    DBGLOG(dap, "could not send injected {} request", command);
    mInjectedRequests.erase(seq);
  }
}

void
DapProxy::OnClientClosed() noexcept
{
  DBGLOG(dap, "client disconnected");
  Shutdown();
}

void
DapProxy::OnAdapterClosed() noexcept
{
  DBGLOG(dap, "debug adapter closed its output");
  Shutdown();
}

void
DapProxy::Shutdown() noexcept
{
  EndSession();
  mInjectedRequests.clear();
  if (mShutdown) {
    return;
  }
  mShutdown = true;
  if (mOnShutdown) {
    mOnShutdown();
  }
}

sync::SessionLifecycle &
DapProxy::Lifecycle() noexcept
{
  return mLifecycle;
}

DapSessionHost *
DapProxy::CurrentSession() noexcept
{
  return mSession.get();
}

u32
DapProxy::PendingInjectedRequests() const noexcept
{
  return static_cast<u32>(mInjectedRequests.size());
}

} // namespace dapsync::ui::dap
