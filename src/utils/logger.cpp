/** LICENSE TEMPLATE */
#include "logger.h"

// dapc
#include <common.h>
#include <configuration/config.h>

// stdlib
#include <utility>

namespace dapc::logging {

Logger *Logger::sLoggerInstance = new Logger{};

/* static */
void
Logger::ConfigureLogging(const cfg::InitializationConfiguration &config) noexcept
{
  ConfigureLogging(config.mLogDirectory, config.mLogChannels);
}

/* static */
void
Logger::ConfigureLogging(const Path &logDirectory, std::span<const Channel> channels) noexcept
{
  for (auto channel : channels) {
    if (sLoggerInstance->GetLogChannel(channel) == nullptr) {
      sLoggerInstance->SetupChannel(logDirectory, channel);
    }
  }
  DBGLOG(core, "channels set: {}, log directory: {}", channels.size(), logDirectory.c_str());
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
  VERIFY(mLogChannels[std::to_underlying(id)] == nullptr, "Channel {} already created", Enum<Channel>::ToString(id));
  const Path p = logDirectory / fmt::format("{}.log", Enum<Channel>::ToString(id));
  auto channel = new LogChannel{ .mChannelMutex = {},
    .mFileStream = std::fstream{ p, std::ios_base::in | std::ios_base::out | std::ios_base::trunc } };
  if (!channel->mFileStream.is_open()) {
    channel->mFileStream.open(p, std::ios_base::out | std::ios_base::trunc);
  }
  mLogChannels[std::to_underlying(id)] = channel;
}

void
Logger::Log(Channel id, std::string_view log_msg) noexcept
{
  if (auto ptr = mLogChannels[std::to_underlying(id)]; ptr) {
    ptr->Log(log_msg);
  }
}

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
  for (auto &chan : mLogChannels) {
    if (chan) {
      chan->mFileStream.flush();
      chan->mFileStream.close();
    }
  }
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

LogChannel *
Logger::GetLogChannel(Channel id) noexcept
{
  return mLogChannels[std::to_underlying(id)];
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

} // namespace dapc::logging
