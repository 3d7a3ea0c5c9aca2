/** LICENSE TEMPLATE */
#include "custom_commands.h"

// dapsync
#include <utils/logger.h>

namespace dapsync::ui::dap {

static CustomCommandResult
Toggle(const Dict &arguments, sync::SessionLifecycle &lifecycle) noexcept
{
  if (const auto requested = GetBoolean(arguments, "enabled"); requested) {
    lifecycle.SetEnabled(*requested);
  } else if (arguments.contains("enabled")) {
    return CustomCommandResult{
      .mSuccess = false, .mErrorMessage = "'enabled' must be a boolean", .mBody = Dict::object()
    };
  } else {
    lifecycle.Toggle();
  }
  Dict body;
  body["enabled"] = lifecycle.IsEnabled();
  return CustomCommandResult{ .mSuccess = true, .mErrorMessage = std::nullopt, .mBody = std::move(body) };
}

static CustomCommandResult
Configure(const Dict &arguments, sync::SessionLifecycle &lifecycle,
          const cfg::SyncConfiguration &baseConfiguration) noexcept
{
  auto config = cfg::ConfigurationFromJson(arguments.is_null() ? Dict::object() : arguments, baseConfiguration);
  if (!config) {
    DBGLOG(warning, "dapsyncConfigure rejected: {}", config.error().mMessage);
    return CustomCommandResult{
      .mSuccess = false, .mErrorMessage = config.error().mMessage, .mBody = Dict::object()
    };
  }
  lifecycle.ReplaceConfiguration(std::move(*config));
  return CustomCommandResult{
    .mSuccess = true, .mErrorMessage = std::nullopt, .mBody = ConfigurationToJson(lifecycle.Configuration())
  };
}

CustomCommandResult
ExecuteCustomCommand(CustomCommand command, const Dict &arguments, sync::SessionLifecycle &lifecycle,
                     const cfg::SyncConfiguration &baseConfiguration) noexcept
{
  DBGLOG(dap, "custom command {}", command);
  switch (command) {
  case CustomCommand::dapsyncToggle:
    return Toggle(arguments, lifecycle);
  case CustomCommand::dapsyncSync:
    lifecycle.SyncCurrentFrame();
    return CustomCommandResult{ .mSuccess = true, .mErrorMessage = std::nullopt, .mBody = Dict::object() };
  case CustomCommand::dapsyncScriptPath: {
    Dict body;
    body["path"] = lifecycle.ReportScriptPath().string();
    return CustomCommandResult{ .mSuccess = true, .mErrorMessage = std::nullopt, .mBody = std::move(body) };
  }
  case CustomCommand::dapsyncConfigure:
    return Configure(arguments, lifecycle, baseConfiguration);
  }
  DSYNC_UNREACHABLE
}

Dict
ConfigurationToJson(const cfg::SyncConfiguration &config) noexcept
{
  Dict result;
  result["host"] = config.mViewerHost;
  result["port"] = config.mViewerPort;
  result["registers"] = config.mRegisterCandidates;
  result["retryInterval"] = config.mRetryInterval.count();
  result["autoEnable"] = config.mAutoEnable;
  result["scriptDirectory"] = config.mScriptDirectory.string();
  return result;
}

} // namespace dapsync::ui::dap
