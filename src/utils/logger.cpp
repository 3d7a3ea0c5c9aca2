/** LICENSE TEMPLATE */
#include "logger.h"

// dapsync
#include <common/panic.h>
#include <configuration/config.h>

namespace dapsync::logging {

Logger *Logger::sLoggerInstance = new Logger{};

/* static */
void
Logger::ConfigureLogging(const dapsync::cfg::InitializationConfiguration &config) noexcept
{
  if (config.mLogChannels.empty()) {
    return;
  }

  std::error_code ec;
  const Path logDirectory = config.mLogDirectory.value_or(fs::current_path(ec));
  if (ec) {
    fmt::print(stderr, "could not determine log directory: {}\n", ec.message());
    return;
  }

  for (auto channel : config.mLogChannels) {
    sLoggerInstance->SetupChannel(logDirectory, channel);
  }
  DBGLOG(core, "logging configured, {} channels open in {}", config.mLogChannels.size(), logDirectory.c_str());
}

Logger::~Logger() noexcept
{
  for (auto ptr : mLogChannels) {
    if (ptr) {
      ptr->mFileStream.flush();
      ptr->mFileStream.close();
      delete ptr;
    }
  }
}

void
Logger::SetupChannel(const Path &logDirectory, Channel id) noexcept
{
  if (mLogChannels[std::to_underlying(id)] != nullptr) {
    return;
  }
  Path p = logDirectory / fmt::format("{}.log", id);
  auto channel = new LogChannel{ .mChannelMutex = {},
    .mFileStream = std::fstream{ p, std::ios_base::out | std::ios_base::trunc } };
  VERIFY(channel->mFileStream.is_open(), "Failed to open log file {}", p.c_str());
  mLogChannels[std::to_underlying(id)] = channel;
}

void
Logger::Log(Channel id, std::string_view logMessage) noexcept
{
  if (auto ptr = mLogChannels[std::to_underlying(id)]; ptr) {
    ptr->Log(logMessage);
  }
}

/* static */
Logger *
Logger::GetLogger() noexcept
{
  return Logger::sLoggerInstance;
}

/* static */
u64
Logger::GetLogMessageId() noexcept
{
  return GetLogger()->mSequenceId++;
}

void
Logger::OnAbort() noexcept
{
  for (auto chan : mLogChannels) {
    if (chan) {
      std::lock_guard guard{ chan->mChannelMutex };
      chan->mFileStream.flush();
    }
  }
}

LogChannel *
Logger::GetLogChannel(Channel id) noexcept
{
  return mLogChannels[std::to_underlying(id)];
}

void
LogChannel::LogMessage(const char *file, u32 line, std::string_view message) noexcept
{
  std::lock_guard guard{ mChannelMutex };
  const auto id = Logger::GetLogMessageId();
  mFileStream << '[' << id << "] " << message << fmt::format(" [{}:{}]", file, line) << std::endl;
}

void
LogChannel::Log(std::string_view msg) noexcept
{
  std::lock_guard guard{ mChannelMutex };
  mFileStream << msg << std::endl;
}

Logger *
GetLogger() noexcept
{
  return Logger::GetLogger();
}

LogChannel *
GetLogChannel(Channel id) noexcept
{
  return GetLogger()->GetLogChannel(id);
}

} // namespace dapsync::logging
