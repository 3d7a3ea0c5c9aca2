/** LICENSE TEMPLATE */
#pragma once

// dapsync
#include <common/typedefs.h>
#include <configuration/command_line.h>
#include <utils/log_channel.h>

// std
#include <chrono>
#include <expected>
#include <string>
#include <vector>

// nlohmann
#include <nlohmann/json_fwd.hpp>

namespace dapsync::cfg {

static constexpr auto kDefaultViewerHost = "127.0.0.1";
static constexpr u16 kDefaultViewerPort = 18888;
static constexpr auto kDefaultRetryInterval = std::chrono::milliseconds{ 3000 };
static constexpr auto kCompanionScriptName = "ghidra_start_goto_server.py";

// Everything the synchronization engine needs to know. Immutable once handed to the engine; runtime
// reconfiguration replaces the whole record.
struct SyncConfiguration
{
  std::string mViewerHost{ kDefaultViewerHost };
  u16 mViewerPort{ kDefaultViewerPort };
  // Tried in order when detecting the program counter. First *completed* read wins.
  std::vector<std::string> mRegisterCandidates{ "pc", "rip", "eip", "r15" };
  std::chrono::milliseconds mRetryInterval{ kDefaultRetryInterval };
  bool mAutoEnable{ false };
  Path mScriptDirectory{};

  Path CompanionScriptPath() const noexcept;
  bool operator==(const SyncConfiguration &) const = default;
};

struct ConfigFileError
{
  enum class Kind : u8
  {
    Unreadable,
    Malformed,
    InvalidValue
  };

  Kind mKind;
  std::string mMessage;
};

// A partial configuration. Unset fields leave the value they are applied to untouched, which is how the
// precedence defaults < config file < command line is implemented.
struct SyncConfigurationOverrides
{
  Option<std::string> mViewerHost;
  Option<u16> mViewerPort;
  Option<std::vector<std::string>> mRegisterCandidates;
  Option<std::chrono::milliseconds> mRetryInterval;
  Option<bool> mAutoEnable;
  Option<Path> mScriptDirectory;

  void ApplyTo(SyncConfiguration &config) const noexcept;
};

// Reads `host`, `port`, `registers`, `retryInterval`, `autoEnable` and `scriptDirectory` from a JSON object.
// Unknown keys are ignored. `registers` is either an array of strings or a comma separated string.
std::expected<SyncConfigurationOverrides, ConfigFileError> OverridesFromJson(const nlohmann::json &object) noexcept;
std::expected<SyncConfigurationOverrides, ConfigFileError> ReadConfigurationFile(const Path &path) noexcept;

// Merge `object` over `defaults`. Used by runtime reconfiguration, which never merges over the previous value.
std::expected<SyncConfiguration, ConfigFileError> ConfigurationFromJson(const nlohmann::json &object,
                                                                        const SyncConfiguration &defaults) noexcept;

class InitializationConfiguration
{
  // Construction only allowed via `ConfigureWithParser`
  InitializationConfiguration() noexcept = default;

public:
  SyncConfigurationOverrides mCommandLine{};
  Option<Path> mConfigFile{};
  Option<Path> mLogDirectory{};
  std::vector<Channel> mLogChannels{};
  Option<std::string> mGotoAddress{};
  bool mPrintScriptPath{ false };
  bool mPrintHelp{ false };
  bool mAutoEnableFlag{ false };
  std::vector<std::string> mAdapterCommand{};

  // The effective configuration. Valid after `Resolve`.
  SyncConfiguration mSync{};

  static std::unique_ptr<InitializationConfiguration> ConfigureWithParser(CommandLineRegistry &parser) noexcept;

  // Builds `mSync` from defaults, then the config file (if any), then the command line.
  std::expected<void, ConfigFileError> Resolve(const Path &defaultScriptDirectory) noexcept;
};

// `<directory of the running executable>/../share/dapsync`
Path DefaultScriptDirectory() noexcept;
} // namespace dapsync::cfg
