/** LICENSE TEMPLATE */
#pragma once
// dapc
#include <common/macros.h>
#include <common/typedefs.h>
#include <utils/log_channel.h>

// dependency
#include <fmt/core.h>

// stdlib
#include <array>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <source_location>
#include <span>
#include <string>
#include <string_view>

namespace dapc::cfg {
class InitializationConfiguration;
}

namespace dapc::logging {

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
  NO_COPY(Logger);

  void SetupChannel(const Path &logDirectory, Channel id) noexcept;
  void Log(Channel id, std::string_view log_msg) noexcept;
  static Logger *GetLogger() noexcept;
  static u64 GetLogMessageId() noexcept;

  // Flush and close every channel. Called on the way out of a panic, the logger is unusable afterwards.
  void OnAbort() noexcept;
  LogChannel *GetLogChannel(Channel id) noexcept;

  static void
  LogIf(Channel id, std::string_view message) noexcept
  {
    if (auto *channel = GetLogger()->GetLogChannel(id); channel) {
      channel->Log(message);
    }
  }

  static void ConfigureLogging(const cfg::InitializationConfiguration &config) noexcept;
  static void ConfigureLogging(const Path &logDirectory, std::span<const Channel> channels) noexcept;

private:
  std::array<LogChannel *, Enum<Channel>::Count()> mLogChannels{};
};

Logger *GetLogger() noexcept;
LogChannel *GetLogChannel(Channel id) noexcept;

#define DBGLOG(channel, ...)                                                                                      \
  if (auto channel = dapc::logging::GetLogChannel(dapc::Channel::channel); channel) {                             \
    std::source_location srcLoc = std::source_location::current();                                                \
    channel->LogMessage(srcLoc.file_name(), srcLoc.line(), ::fmt::format(__VA_ARGS__));                           \
  }

// CONDITIONAL DEBUG LOG
#define CDLOG(condition, channel_name, ...)                                                                       \
  if ((condition)) {                                                                                              \
    DBGLOG(channel_name, __VA_ARGS__)                                                                             \
  }

#define DBGLOG_STR(channel, str)                                                                                  \
  if (auto channel = dapc::logging::GetLogChannel(dapc::Channel::channel); channel) {                             \
    std::source_location srcLoc = std::source_location::current();                                                \
    channel->LogMessage(srcLoc.file_name(), srcLoc.line(), str);                                                  \
  }

} // namespace dapc::logging
