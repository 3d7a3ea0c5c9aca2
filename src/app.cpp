/** LICENSE TEMPLATE */
#include "app.h"

// dapsync
#include <configuration/command_line.h>
#include <configuration/config.h>
#include <event_loop.h>
#include <interface/adapter_process.h>
#include <interface/dap/connection.h>
#include <interface/dap/proxy.h>
#include <sync/address.h>
#include <sync/address_forwarder.h>
#include <sync/http_viewer_transport.h>
#include <utils/logger.h>

// std
#include <csignal>
#include <cstring>
#include <span>

// fmt
#include <fmt/core.h>
#include <fmt/ranges.h>

// system
#include <unistd.h>

namespace dapsync {

static constexpr auto kUsage = "dapsync [options] -- <debug adapter> [adapter arguments...]";

// One-shot mode: forward a single address and report how it went.
static int
RunGoto(const cfg::SyncConfiguration &config, std::string_view address) noexcept
{
  const sync::ViewerEndpoint endpoint{ .mHost = config.mViewerHost, .mPort = config.mViewerPort };
  const auto canonical = sync::CanonicalAddress(address);
  const auto result = sync::HttpViewerTransport::SendGotoRequest(
    endpoint, canonical, sync::HttpViewerTransport::kDefaultIoTimeout);
  if (!result) {
    fmt::print(stderr, "Failed to send {} to {}:{}: {}\n", canonical, endpoint.mHost, endpoint.mPort,
               result.error().mMessage);
    return 1;
  }
  if (!sync::AddressForwarder::IsSuccess(result)) {
    fmt::print(stderr, "Viewer at {}:{} answered {}\n", endpoint.mHost, endpoint.mPort, *result);
    return 1;
  }
  fmt::print("{}\n", canonical);
  return 0;
}

static int
RunProxy(const cfg::SyncConfiguration &config, std::span<const std::string> adapterCommand) noexcept
{
  auto adapter = AdapterProcess::Spawn(adapterCommand);
  if (!adapter) {
    fmt::print(stderr, "dapsync: could not start debug adapter: {}\n", adapter.error().mMessage);
    DBGLOG(core, "spawn failed: {} (errno {})", adapter.error().mMessage, adapter.error().mErrno);
    return 1;
  }

  // A client or adapter going away must show up as a failed write, not kill us.
  signal(SIGPIPE, SIG_IGN);

  EventLoop loop{};
  sync::HttpViewerTransport transport{ [&loop](std::function<void()> task) { loop.Post(std::move(task)); } };
  ui::dap::FileDescriptorWriter clientWriter{ STDOUT_FILENO };
  ui::dap::FileDescriptorWriter adapterWriter{ (*adapter)->InputFd() };
  ui::dap::DapProxy proxy{ transport, loop, config, clientWriter, adapterWriter, [&loop]() { loop.Stop(); } };

  ui::dap::ConnectionReader clientReader{ "dapsync-client",
    STDIN_FILENO,
    loop,
    [&proxy](std::string payload) { proxy.OnClientMessage(std::move(payload)); },
    [&proxy]() { proxy.OnClientClosed(); } };
  ui::dap::ConnectionReader adapterReader{ "dapsync-adapter",
    (*adapter)->OutputFd(),
    loop,
    [&proxy](std::string payload) { proxy.OnAdapterMessage(std::move(payload)); },
    [&proxy]() { proxy.OnAdapterClosed(); } };

  clientReader.Start();
  adapterReader.Start();
  DBGLOG(core, "relaying between client and adapter {}", (*adapter)->GetPid());
  loop.Run();

  clientReader.Stop();
  adapterReader.Stop();
  (*adapter)->CloseInput();
  const auto exitCode = (*adapter)->WaitForExit();
  DBGLOG(core, "debug adapter exited with {}", exitCode);
  return exitCode == 0 ? 0 : 1;
}

int
Start(int argc, const char **argv) noexcept
{
  cfg::CommandLineRegistry parser{};
  auto configuration = cfg::InitializationConfiguration::ConfigureWithParser(parser);

  cfg::CommandLineResult result = parser.Parse(argc, argv);
  if (!result.mErrors.empty()) {
    parser.PrintHelp(kUsage);
    fmt::print("\n");
    for (const auto &err : result.mErrors) {
      fmt::print(stderr, "{}\n", err);
    }
    return 1;
  }

  if (configuration->mPrintHelp) {
    parser.PrintHelp(kUsage);
    return 0;
  }

  logging::Logger::ConfigureLogging(*configuration);
  DBGLOG(core, "dapsync arguments: {}", fmt::join(std::span{ argv, argv + argc }.subspan(1), " "));

  if (auto resolved = configuration->Resolve(cfg::DefaultScriptDirectory()); !resolved) {
    fmt::print(stderr, "dapsync: {}\n", resolved.error().mMessage);
    DBGLOG(core, "configuration failed: {}", resolved.error().mMessage);
    return 1;
  }
  const auto &config = configuration->mSync;
  DBGLOG(core, "viewer at {}:{}, registers [{}], retry every {}ms, auto-enable {}", config.mViewerHost,
         config.mViewerPort, fmt::join(config.mRegisterCandidates, ", "), config.mRetryInterval.count(),
         config.mAutoEnable);

  if (configuration->mPrintScriptPath) {
    fmt::print("{}\n", config.CompanionScriptPath().string());
    return 0;
  }

  if (configuration->mGotoAddress) {
    return RunGoto(config, *configuration->mGotoAddress);
  }

  configuration->mAdapterCommand = std::move(result.mTrailingArguments);
  if (configuration->mAdapterCommand.empty()) {
    fmt::print(stderr, "dapsync: no debug adapter command given\nUsage: {}\n", kUsage);
    return 1;
  }

  return RunProxy(config, configuration->mAdapterCommand);
}

} // namespace dapsync
