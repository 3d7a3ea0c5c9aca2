/** LICENSE TEMPLATE */
#pragma once
// dapsync
#include <common/macros.h>
#include <common/typedefs.h>
#include <utils/log_channel.h>

// stdlib
#include <array>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <source_location>
#include <string>
#include <string_view>

// fmt
#include <fmt/core.h>

namespace dapsync::cfg {
struct InitializationConfiguration;
}

namespace dapsync::logging {

struct LogChannel
{
  std::mutex mChannelMutex;
  std::fstream mFileStream;
  void LogMessage(const char *file, u32 line, std::string_view message) noexcept;
  void Log(std::string_view msg) noexcept;
};

class Logger
{
  static Logger *sLoggerInstance;
  std::atomic<u64> mSequenceId{ 0 };

public:
  Logger() noexcept = default;
  ~Logger() noexcept;
  void SetupChannel(const std::filesystem::path &logDirectory, Channel id) noexcept;
  void Log(Channel id, std::string_view logMessage) noexcept;
  static Logger *GetLogger() noexcept;
  static u64 GetLogMessageId() noexcept;

  // Flush and close every open channel. Called on panic, before the process goes down.
  void OnAbort() noexcept;
  LogChannel *GetLogChannel(Channel id) noexcept;

  // Opens `<log dir>/<channel>.log` for each channel the configuration selected. Channels that were not selected
  // stay closed and logging to them is a no-op.
  static void ConfigureLogging(const dapsync::cfg::InitializationConfiguration &config) noexcept;

private:
  std::array<LogChannel *, Enum<Channel>::Count()> mLogChannels{};
};

Logger *GetLogger() noexcept;
LogChannel *GetLogChannel(Channel id) noexcept;

#define DBGLOG(channel, ...)                                                                                      \
  if (auto logChannel = ::dapsync::logging::GetLogChannel(Channel::channel); logChannel) {                        \
    std::source_location srcLoc = std::source_location::current();                                                \
    logChannel->LogMessage(srcLoc.file_name(), srcLoc.line(), ::fmt::format(__VA_ARGS__));                        \
  }

} // namespace dapsync::logging
