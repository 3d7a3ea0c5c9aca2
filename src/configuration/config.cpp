/** LICENSE TEMPLATE */
#include "config.h"

// dapsync
#include <configuration/command_line.h>
#include <utils/logger.h>
#include <utils/util.h>

// std
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <limits>

// nlohmann
#include <nlohmann/json.hpp>

namespace dapsync::cfg {

Path
SyncConfiguration::CompanionScriptPath() const noexcept
{
  return mScriptDirectory / kCompanionScriptName;
}

void
SyncConfigurationOverrides::ApplyTo(SyncConfiguration &config) const noexcept
{
  if (mViewerHost) {
    config.mViewerHost = *mViewerHost;
  }
  if (mViewerPort) {
    config.mViewerPort = *mViewerPort;
  }
  if (mRegisterCandidates) {
    config.mRegisterCandidates = *mRegisterCandidates;
  }
  if (mRetryInterval) {
    config.mRetryInterval = *mRetryInterval;
  }
  if (mAutoEnable) {
    config.mAutoEnable = *mAutoEnable;
  }
  if (mScriptDirectory) {
    config.mScriptDirectory = *mScriptDirectory;
  }
}

static ConfigFileError
InvalidValue(std::string_view key, std::string_view expected) noexcept
{
  return ConfigFileError{ ConfigFileError::Kind::InvalidValue,
    fmt::format("configuration key '{}' must be {}", key, expected) };
}

std::expected<SyncConfigurationOverrides, ConfigFileError>
OverridesFromJson(const nlohmann::json &object) noexcept
{
  if (!object.is_object()) {
    return std::unexpected(ConfigFileError{ ConfigFileError::Kind::Malformed, "configuration must be an object" });
  }

  SyncConfigurationOverrides result{};

  for (const auto &[key, value] : object.items()) {
    if (key == "host") {
      if (!value.is_string() || value.get_ref<const std::string &>().empty()) {
        return std::unexpected(InvalidValue(key, "a non-empty string"));
      }
      result.mViewerHost = value.get<std::string>();
    } else if (key == "port") {
      if (!value.is_number_integer() || value.get<i64>() <= 0 || value.get<i64>() > 65535) {
        return std::unexpected(InvalidValue(key, "an integer in 1..65535"));
      }
      result.mViewerPort = static_cast<u16>(value.get<i64>());
    } else if (key == "registers") {
      std::vector<std::string> registers;
      if (value.is_string()) {
        registers = SplitTrimmed(value.get_ref<const std::string &>(), ',');
      } else if (value.is_array()) {
        for (const auto &reg : value) {
          if (!reg.is_string() || Trim(reg.get_ref<const std::string &>()).empty()) {
            return std::unexpected(InvalidValue(key, "a list of register names"));
          }
          registers.emplace_back(Trim(reg.get_ref<const std::string &>()));
        }
      }
      if (registers.empty()) {
        return std::unexpected(InvalidValue(key, "a non-empty list of register names"));
      }
      result.mRegisterCandidates = std::move(registers);
    } else if (key == "retryInterval") {
      // Same range as --retry-interval. Anything larger overflows the timer clock.
      if (!value.is_number_integer() || value.get<i64>() <= 0 ||
          value.get<i64>() > std::numeric_limits<u32>::max()) {
        return std::unexpected(InvalidValue(key, "a positive number of milliseconds"));
      }
      result.mRetryInterval = std::chrono::milliseconds{ value.get<i64>() };
    } else if (key == "autoEnable") {
      if (!value.is_boolean()) {
        return std::unexpected(InvalidValue(key, "a boolean"));
      }
      result.mAutoEnable = value.get<bool>();
    } else if (key == "scriptDirectory") {
      if (!value.is_string()) {
        return std::unexpected(InvalidValue(key, "a path"));
      }
      result.mScriptDirectory = Path{ value.get<std::string>() };
    } else {
      DBGLOG(warning, "unknown configuration key '{}' ignored", key);
    }
  }

  return result;
}

std::expected<SyncConfigurationOverrides, ConfigFileError>
ReadConfigurationFile(const Path &path) noexcept
{
  std::ifstream file{ path };
  if (!file.is_open()) {
    return std::unexpected(
      ConfigFileError{ ConfigFileError::Kind::Unreadable, fmt::format("could not open {}", path.c_str()) });
  }

  try {
    const auto document = nlohmann::json::parse(file);
    return OverridesFromJson(document);
  } catch (const nlohmann::json::exception &e) {
    return std::unexpected(ConfigFileError{ ConfigFileError::Kind::Malformed,
      fmt::format("could not parse {}: {}", path.c_str(), e.what()) });
  }
}

std::expected<SyncConfiguration, ConfigFileError>
ConfigurationFromJson(const nlohmann::json &object, const SyncConfiguration &defaults) noexcept
{
  auto overrides = OverridesFromJson(object);
  if (!overrides) {
    return std::unexpected(std::move(overrides.error()));
  }
  SyncConfiguration config = defaults;
  overrides->ApplyTo(config);
  return config;
}

Path
DefaultScriptDirectory() noexcept
{
  std::error_code ec;
  const auto executable = fs::read_symlink("/proc/self/exe", ec);
  if (ec) {
    return fs::current_path(ec);
  }
  return (executable.parent_path() / ".." / "share" / "dapsync").lexically_normal();
}

std::expected<void, ConfigFileError>
InitializationConfiguration::Resolve(const Path &defaultScriptDirectory) noexcept
{
  SyncConfiguration config{};
  config.mScriptDirectory = defaultScriptDirectory;

  if (mConfigFile) {
    auto fileOverrides = ReadConfigurationFile(*mConfigFile);
    if (!fileOverrides) {
      return std::unexpected(std::move(fileOverrides.error()));
    }
    fileOverrides->ApplyTo(config);
  }

  if (mAutoEnableFlag) {
    mCommandLine.mAutoEnable = true;
  }
  mCommandLine.ApplyTo(config);
  mSync = std::move(config);
  return {};
}

/* static */
std::unique_ptr<InitializationConfiguration>
InitializationConfiguration::ConfigureWithParser(CommandLineRegistry &parser) noexcept
{
  auto config = std::unique_ptr<InitializationConfiguration>(new InitializationConfiguration{});

  parser.AddOption("-H",
    "--host",
    "Host name or address of the viewer's goto server. Default: 127.0.0.1. JSON config key: host.",
    config->mCommandLine.mViewerHost,
    [](ArgIterator &it) noexcept -> ParseResult<Option<std::string>> {
      auto arg = TryExpected(it);
      if (arg.empty()) {
        return it.Error(ParseErrorType::InvalidFormat);
      }
      return std::string{ arg };
    },
    std::nullopt);

  parser.AddOption("-p",
    "--port",
    "Port of the viewer's goto server. Default: 18888. JSON config key: port.",
    config->mCommandLine.mViewerPort,
    [](ArgIterator &it) noexcept -> ParseResult<Option<u16>> {
      auto port = FromTraits<u16>::From(it);
      if (!port) {
        return std::unexpected(std::move(port.error()));
      }
      if (*port == 0) {
        return it.Error(ParseErrorType::OutOfRange);
      }
      return *port;
    },
    std::nullopt);

  parser.AddOption("-r",
    "--registers",
    "Comma separated register names tried when detecting the program counter. Default: pc,rip,eip,r15. The "
    "first register that successfully evaluates is used for the rest of the debug session. JSON config key: "
    "registers.",
    config->mCommandLine.mRegisterCandidates,
    [](ArgIterator &it) noexcept -> ParseResult<Option<std::vector<std::string>>> {
      auto arg = TryExpected(it);
      auto registers = SplitTrimmed(arg, ',');
      if (registers.empty()) {
        return it.Error(ParseErrorType::InvalidFormat);
      }
      return registers;
    },
    std::nullopt);

  parser.AddOption("-i",
    "--retry-interval",
    "Milliseconds between attempts to reach the viewer after a failed forward. Must be greater than 0. Default: "
    "3000. JSON config key: retryInterval.",
    config->mCommandLine.mRetryInterval,
    [](ArgIterator &it) noexcept -> ParseResult<Option<std::chrono::milliseconds>> {
      auto interval = FromTraits<u32>::From(it);
      if (!interval) {
        return std::unexpected(std::move(interval.error()));
      }
      if (*interval == 0) {
        return it.Error(ParseErrorType::OutOfRange);
      }
      return std::chrono::milliseconds{ *interval };
    },
    std::nullopt);

  parser.AddFlag("-a",
    "--auto-enable",
    "Synchronize from the start of every debug session, without waiting for a toggle request. JSON config key: "
    "autoEnable.",
    config->mAutoEnableFlag);

  parser.AddOption("-c",
    "--config",
    "Path to a JSON configuration file. Command line options take precedence over its values.",
    config->mConfigFile,
    [](ArgIterator &it) noexcept -> ParseResult<Option<Path>> {
      auto arg = TryExpected(it);
      if (!fs::is_regular_file(arg)) {
        return it.Error(ParseErrorType::FileDoesNotExist);
      }
      return Path{ arg };
    },
    std::nullopt);

  parser.AddOption("-l",
    "--log",
    "The directory where log files should be saved. If that directory doesn't exist, it will not be created for "
    "you, and dapsync will terminate. Defaults to the current working directory.",
    config->mLogDirectory,
    [](ArgIterator &it) noexcept -> ParseResult<Option<Path>> {
      auto arg = TryExpected(it);
      if (fs::is_directory(arg)) {
        return Path{ arg };
      }
      return it.Error(ParseErrorType::DirectoryDoesNotExist);
    },
    std::nullopt);

  parser.AddOption("-s",
    "--script-dir",
    "Directory containing the viewer-side companion script. Default: <executable dir>/../share/dapsync. JSON "
    "config key: scriptDirectory.",
    config->mCommandLine.mScriptDirectory,
    [](ArgIterator &it) noexcept -> ParseResult<Option<Path>> {
      auto arg = TryExpected(it);
      return Path{ arg };
    },
    std::nullopt);

  parser.AddOption("-g",
    "--goto",
    "Forward a single address to the viewer and exit. Exit status is 0 if the viewer accepted it.",
    config->mGotoAddress,
    [](ArgIterator &it) noexcept -> ParseResult<Option<std::string>> {
      auto arg = TryExpected(it);
      if (Trim(arg).empty()) {
        return it.Error(ParseErrorType::InvalidFormat);
      }
      return std::string{ Trim(arg) };
    },
    std::nullopt);

  parser.AddFlag("", "--script-path", "Print the path of the viewer-side companion script and exit.",
    config->mPrintScriptPath);

  parser.AddFlag("-h", "--help", "Print this help and exit.", config->mPrintHelp);

#define LOG_HELP(channel, name, help) "\n - " #channel ": " help

  parser.AddEnvironmentVariable<std::vector<Channel>>("LOG",
    "Comma separated list of logging channels to open, or 'all'. Channels:" FOR_EACH_LOG(LOG_HELP),
    config->mLogChannels,
    [](std::string_view stringView) -> ParseResult<std::vector<Channel>> {
      std::vector<Channel> result{};
      auto splits = SplitTrimmed(stringView, ',');
      if (std::ranges::any_of(splits, [](std::string_view cfg) { return cfg == "all"; })) {
        const auto channels = Enum<Channel>::Variants();
        result.assign(channels.begin(), channels.end());
        return result;
      }

      result.reserve(splits.size());
      for (const auto &el : splits) {
        if (const auto chan = Enum<Channel>::FromString(el); chan) {
          result.push_back(*chan);
        } else {
          return std::unexpected(ParserError{ ParseErrorType::InvalidFormat, {} });
        }
      }
      return result;
    });

#undef LOG_HELP

  return config;
}
} // namespace dapsync::cfg
