/** LICENSE TEMPLATE */
#pragma once
// dapsync
#include <common/macros.h>
#include <configuration/config.h>
#include <interface/dap/protocol.h>
#include <sync/session_lifecycle.h>

// std
#include <string>

// Requests the proxy answers itself. They never reach the debug adapter.
#define FOR_EACH_CUSTOM_COMMAND(FN)                                                                               \
  FN(dapsyncToggle)                                                                                               \
  FN(dapsyncSync)                                                                                                 \
  FN(dapsyncScriptPath)                                                                                           \
  FN(dapsyncConfigure)

ENUM_TYPE_METADATA(CustomCommand, FOR_EACH_CUSTOM_COMMAND, DEFAULT_ENUM, u8)

namespace dapsync::ui::dap {

struct CustomCommandResult
{
  bool mSuccess;
  Option<std::string> mErrorMessage;
  Dict mBody;
};

constexpr Option<CustomCommand>
ParseCustomCommand(std::string_view command) noexcept
{
  return Enum<CustomCommand>::FromString(command);
}

/**
 * dapsyncToggle     { enabled?: bool }  -> { enabled: bool }. Without `enabled` the state is flipped.
 * dapsyncSync       {}                  -> {}. Problems are reported as output events, not as a failed response.
 * dapsyncScriptPath {}                  -> { path: string }
 * dapsyncConfigure  { host?, port?, registers?, retryInterval?, autoEnable?, scriptDirectory? }
 *                                       -> the configuration now in effect. Merged over `baseConfiguration`.
 */
CustomCommandResult ExecuteCustomCommand(CustomCommand command, const Dict &arguments,
                                         sync::SessionLifecycle &lifecycle,
                                         const cfg::SyncConfiguration &baseConfiguration) noexcept;

Dict ConfigurationToJson(const cfg::SyncConfiguration &config) noexcept;

} // namespace dapsync::ui::dap
