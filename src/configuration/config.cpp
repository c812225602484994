/** LICENSE TEMPLATE */
#include "config.h"

// dapc
#include <utils/logger.h>

// std
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace dapc::cfg {

static constexpr u32 kDefaultPollIntervalMs = 50;

ParseResult<std::vector<std::string>>
SplitCommandLine(std::string_view commandLine) noexcept
{
  std::vector<std::string> result;
  while (!commandLine.empty()) {
    while (!commandLine.empty() && std::isspace(static_cast<unsigned char>(commandLine.front()))) {
      commandLine.remove_prefix(1);
    }
    const auto end = std::find_if(commandLine.begin(), commandLine.end(), [](char c) {
      return std::isspace(static_cast<unsigned char>(c));
    });
    const auto length = static_cast<size_t>(std::distance(commandLine.begin(), end));
    if (length > 0) {
      result.emplace_back(commandLine.substr(0, length));
    }
    commandLine.remove_prefix(length);
  }

  if (result.empty()) {
    return std::unexpected(ParserError{ ParseErrorType::EmptyCommandLine, {} });
  }
  return result;
}

ParseResult<std::vector<Channel>>
ParseLogChannels(std::string_view channels) noexcept
{
  std::vector<Channel> result{};
  while (!channels.empty()) {
    const auto comma = channels.find(',');
    const auto name = channels.substr(0, comma);
    if (name == "all") {
      const auto all = Enum<Channel>::Variants();
      return std::vector<Channel>{ all.begin(), all.end() };
    }
    if (const auto chan = Enum<Channel>::FromString(name); chan) {
      if (std::find(result.begin(), result.end(), *chan) == result.end()) {
        result.push_back(*chan);
      }
    } else if (!name.empty()) {
      return std::unexpected(ParserError{ ParseErrorType::InvalidFormat, { name } });
    }
    if (comma == channels.npos) {
      break;
    }
    channels.remove_prefix(comma + 1);
  }
  return result;
}

std::string
InitializationConfiguration::AdapterId() const noexcept
{
  if (!mAdapterId.empty()) {
    return mAdapterId;
  }
  if (mAdapterCommandLine.empty()) {
    return "dapc";
  }
  return fs::path{ mAdapterCommandLine.front() }.filename().string();
}

/* static */
std::unique_ptr<InitializationConfiguration>
InitializationConfiguration::ConfigureWithParser(CommandLineRegistry &parser) noexcept
{
  std::unique_ptr<InitializationConfiguration> config{ new InitializationConfiguration{} };

  parser.AddOption("-a",
    "--adapter",
    "The command line that starts the debug adapter, e.g. \"lldb-dap\" or \"python -m debugpy.adapter\". The "
    "adapter must speak the debug adapter protocol over its standard input and output.",
    &InitializationConfiguration::mAdapterCommandLine,
    config.get(),
    [](ArgIterator &it) -> ParseResult<std::vector<std::string>> {
      auto arg = TryExpected(it);
      auto result = SplitCommandLine(arg);
      if (!result) {
        return it.Error(result.error().mError);
      }
      return result;
    },
    std::vector<std::string>{});

  parser.AddOption("-d",
    "--debugee",
    "Path to the program that the adapter should launch.",
    &InitializationConfiguration::mDebugee,
    config.get(),
    [](ArgIterator &it) -> ParseResult<fs::path> {
      auto arg = TryExpected(it);
      if (fs::exists(arg)) {
        return fs::path{ arg };
      }
      return it.Error(ParseErrorType::FileDoesNotExist);
    },
    fs::path{});

  parser.AddOption("-l",
    "--log",
    "The directory where log files should be saved. If that directory doesn't exist, it will not be created for "
    "you, and dapc will terminate.",
    &InitializationConfiguration::mLogDirectory,
    config.get(),
    [](ArgIterator &it) -> ParseResult<fs::path> {
      auto arg = TryExpected(it);
      if (fs::is_directory(arg)) {
        return fs::path{ arg };
      }
      return it.Error(ParseErrorType::DirectoryDoesNotExist);
    },
    fs::current_path());

  parser.AddOption("",
    "--adapter-id",
    "The adapterID sent in the initialize request. Defaults to the file name of the adapter executable.",
    &InitializationConfiguration::mAdapterId,
    config.get(),
    &FromTraits<std::string>::From,
    std::string{});

  parser.AddOption("-p",
    "--poll-interval",
    "Milliseconds to wait for adapter output on each poll of the control loop and the blocking wait helpers.",
    &InitializationConfiguration::mPollIntervalMs,
    config.get(),
    &FromTraits<u32>::From,
    kDefaultPollIntervalMs);

  parser.AddOption("",
    "--debug-connection",
    "Log every message read from and written to the adapter, verbatim, to the dap log channel.",
    &InitializationConfiguration::mDebugConnection,
    config.get(),
    &FromTraits<bool>::From,
    false);

  parser.AddOption("-h",
    "--help",
    "Print this help and exit.",
    &InitializationConfiguration::mHelp,
    config.get(),
    &FromTraits<bool>::From,
    false);

#define LOG_HELP(channel, name, help) "\n - " name ": " help

  parser.AddEnvironmentVariable("DAPC_LOG",
    "Configure what logging channels should be opened (comma separated, or 'all'). Defaults to all." FOR_EACH_LOG(
      LOG_HELP),
    &InitializationConfiguration::mLogChannels,
    config.get(),
    [](std::string_view value) -> ParseResult<std::vector<Channel>> { return ParseLogChannels(value); },
    std::vector<Channel>{ Enum<Channel>::Variants().begin(), Enum<Channel>::Variants().end() });

#undef LOG_HELP

  return config;
}
} // namespace dapc::cfg
