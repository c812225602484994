/** LICENSE TEMPLATE */
#pragma once

// dapc
#include <common.h>
#include <configuration/command_line.h>
#include <utils/log_channel.h>

// std
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace dapc::cfg {

class InitializationConfiguration
{
  // Construction only allowed via `ConfigureWithParser`
  InitializationConfiguration() noexcept = default;

public:
  // argv of the debug adapter, argv[0] is looked up in PATH
  std::vector<std::string> mAdapterCommandLine;
  // The program the adapter is asked to launch
  std::filesystem::path mDebugee;
  std::filesystem::path mLogDirectory;
  // adapterID field of the initialize request. Empty means "derive from the adapter executable"
  std::string mAdapterId;
  // Interval used by the blocking wait helpers and by the control loop
  u32 mPollIntervalMs;
  bool mDebugConnection;
  bool mHelp;
  std::vector<Channel> mLogChannels;

  std::string AdapterId() const noexcept;

  static std::unique_ptr<InitializationConfiguration> ConfigureWithParser(CommandLineRegistry &parser) noexcept;
};

// Split a command line on whitespace. No quoting rules, the adapter's argv is expected to be simple.
ParseResult<std::vector<std::string>> SplitCommandLine(std::string_view commandLine) noexcept;

// Parse a comma separated list of log channel names, "all" enabling every channel.
ParseResult<std::vector<Channel>> ParseLogChannels(std::string_view channels) noexcept;

} // namespace dapc::cfg
