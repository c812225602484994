/** LICENSE TEMPLATE */
#include "command_line.h"

// dapc
#include <utils/logger.h>

// std
#include <algorithm>
#include <cstdlib>

// system
#include <sys/ioctl.h>
#include <unistd.h>

namespace dapc::cfg {

std::vector<std::string_view>
HelpMessage::CreateLinesOfWidth(size_t width) const noexcept
{
  std::vector<std::string_view> result;
  auto txt = mInfo;
  while (!txt.empty()) {
    if (const auto newline = txt.find('\n'); newline != txt.npos && newline <= width) {
      result.push_back(txt.substr(0, newline));
      txt.remove_prefix(newline + 1);
      continue;
    }
    if (txt.size() <= width) {
      result.push_back(txt);
      break;
    }
    auto split = txt.substr(0, width).find_last_of(' ');
    if (split == txt.npos || split == 0) {
      split = width;
    }
    result.push_back(txt.substr(0, split));
    txt.remove_prefix(split);
    while (!txt.empty() && txt.front() == ' ') {
      txt.remove_prefix(1);
    }
  }
  return result;
}

CommandLineResult
CommandLineRegistry::Parse(int argc, const char **argv) noexcept
{
  CommandLineResult result{};

  result.mErrors.reserve(argc);
  for (auto &opt : GetOptions()) {
    opt->ApplyDefault();
  }
  ArgIterator it(argc, argv);
  while (it.HasNext()) {
    auto current = it.BeginNext();

    if (auto optionIter = mOptions.find(current); optionIter != std::end(mOptions)) {
      auto res = optionIter->second->Parse(it);
      if (!res) {
        result.mErrors.push_back(std::move(res.error()));
      }
    } else {
      result.mErrors.push_back(it.Error(ParseErrorType::UnrecognizedArgument).error());
    }
  }

  // Environment variables fail silently, because they're not intended to be "hard options".
  ParseEnvironmentVariableOptions();
  return result;
}

void
CommandLineRegistry::ParseEnvironmentVariableOptions() noexcept
{
  for (auto &opt : GetEnvironmentVariableOptions()) {
    opt->ApplyDefault();
  }

  for (const auto &[k, v] : mEnvironmentVariables) {
    if (auto value = getenv(std::string{ k }.c_str()); value) {
      if (auto res = v->Parse(std::string_view{ value }); !res) {
        DBGLOG(warning, "Ignoring environment variable {}: {}", k, ParseErrorMessage(res.error().mError));
      }
    }
  }
}

std::pair<u16, u16>
CommandLineRegistry::GetTerminalSize() const noexcept
{
  struct winsize terminalSize;

  if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &terminalSize) == 0) {
    auto leftColumnWidth = static_cast<u16>(terminalSize.ws_col * 0.25);
    if (leftColumnWidth <= mLeftColumnDisplayWidth) {
      leftColumnWidth = mLeftColumnDisplayWidth + 1;
    } else {
      // Don't waste space, give the left column at most 4 characters of trailing white space after it.
      leftColumnWidth = std::min<u16>(leftColumnWidth, mLeftColumnDisplayWidth + 4);
    }
    const auto rightColumnWidth = static_cast<u16>(terminalSize.ws_col - leftColumnWidth);

    return std::pair<u16, u16>{ leftColumnWidth, rightColumnWidth };
  }
  // Not a terminal, probably piped somewhere.
  const auto left = static_cast<u16>(mLeftColumnDisplayWidth + 1);
  return std::pair<u16, u16>{ left, static_cast<u16>(80 - std::min<u16>(left, 40)) };
}

void
CommandLineRegistry::PrintHelpAbout(const OptionMetadata &option, u16 leftColumn, u16 rightColumn) const noexcept
{
  std::string left{ "  " };
  if (!option.mShortName.empty()) {
    left += fmt::format("{}, ", option.mShortName);
  }
  left += option.mLongName;
  if (!option.mIsFlag) {
    left += kValuePlaceHolder;
  }

  const auto lines = option.mInfo.CreateLinesOfWidth(rightColumn);
  if (lines.empty()) {
    fmt::print("{}\n", left);
    return;
  }
  fmt::print("{:<{}}{}\n", left, leftColumn, lines.front());
  for (const auto &line : std::span{ lines }.subspan(1)) {
    fmt::print("{:<{}}{}\n", "", leftColumn, line);
  }
}

void
CommandLineRegistry::PrintHelp() const noexcept
{
  fmt::print("Usage:\n\n");
  fmt::print("  {} [options]\n\n", mProgramName);
  fmt::print("Options:\n\n");

  auto [leftColumn, rightColumn] = GetTerminalSize();

  auto options = GetOptions();
  std::sort(options.begin(), options.end(), [](const auto &a, const auto &b) { return a->mLongName < b->mLongName; });
  for (const auto &option : options) {
    PrintHelpAbout(*option, leftColumn, rightColumn);
  }

  fmt::print("\nEnvironment variables:\n\n");
  for (const auto &envVar : GetEnvironmentVariableOptions()) {
    PrintHelpAbout(*envVar, leftColumn, rightColumn);
  }
}

} // namespace dapc::cfg
