/** LICENSE TEMPLATE */
#pragma once

// dapc
#include <common.h>
#include <common/typedefs.h>

// dependency
#include <fmt/core.h>

// std
#include <cctype>
#include <charconv>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <vector>

using namespace std::string_view_literals;

namespace dapc::cfg {

#define FOR_CLI_EACH_PARSE_ERROR(MAKE_ERR)                                                                        \
  MAKE_ERR(None, "Error not set.")                                                                                \
  MAKE_ERR(ArgNotFound, "Argument not found.")                                                                    \
  MAKE_ERR(MissingArgValue, "Command line option is missing it's value.")                                         \
  MAKE_ERR(InvalidFormat, "Invalid format of argument.")                                                          \
  MAKE_ERR(UnrecognizedArgument, "Argument is not a recognized option.")                                          \
  MAKE_ERR(DirectoryDoesNotExist, "Directory does not exist")                                                     \
  MAKE_ERR(FileDoesNotExist, "File does not exist")                                                               \
  MAKE_ERR(EmptyCommandLine, "Command line for the adapter is empty")

enum class ParseErrorType : u8
{
  FOR_CLI_EACH_PARSE_ERROR(DEFAULT_ENUM)
};

constexpr std::string_view
ParseErrorMessage(ParseErrorType type) noexcept
{
#define PARSE_ERROR_MSG(EnumValue, Message, ...)                                                                  \
  case ParseErrorType::EnumValue:                                                                                 \
    return Message;

  switch (type) {
    FOR_CLI_EACH_PARSE_ERROR(PARSE_ERROR_MSG)
  }
#undef PARSE_ERROR_MSG
  DAPC_UNREACHABLE
}

struct ParseOk
{
};

struct ParserError
{
  ParseErrorType mError;
  std::vector<std::string_view> mInputs;

  operator std::unexpected<ParserError>() && noexcept { return std::unexpected<ParserError>(std::move(*this)); }
};

template <typename T> using ParseResult = std::expected<T, ParserError>;

struct HelpMessage
{
  std::string_view mInfo{};

  constexpr HelpMessage() noexcept = default;
  constexpr HelpMessage(std::string_view message) noexcept : mInfo(message) {}
  constexpr HelpMessage(const char *message) noexcept : mInfo(message) {}

  // Break the help text into lines of at most `width` characters, splitting at the last whitespace if possible.
  std::vector<std::string_view> CreateLinesOfWidth(size_t width) const noexcept;
};

class ArgIterator
{
public:
  constexpr ArgIterator(int argc, const char **argv) : mArgCount(argc), mArgs(argv) {}

  bool
  HasNext() const noexcept
  {
    return mIndex < mArgCount || mInsideInlineArgument.has_value();
  }

  // Called at the beginning of each parse pass, which may consume 0 or N arguments from the argument vector. It's
  // the first thing each iteration in CommandLineRegistry::Parse does, after having checked HasNext().
  std::string_view
  BeginNext() noexcept
  {
    RememberPosition();
    return *GetNext();
  }

  std::optional<std::string_view>
  GetNext() noexcept
  {
    if (mInsideInlineArgument) {
      std::string_view value = mArgs[mIndex];
      value.remove_prefix(mInsideInlineArgument.value());
      mInsideInlineArgument = {};
      ++mIndex;
      return value;
    }

    if (mIndex >= mArgCount) {
      return std::nullopt;
    }
    std::string_view value = mArgs[mIndex];
    auto inlineValuePos = value.find_first_of('=');
    if (value.starts_with('-') && inlineValuePos != value.npos) {
      mInsideInlineArgument = inlineValuePos + 1;
      return value.substr(0, inlineValuePos);
    } else {
      ++mIndex;
    }
    return value;
  }

  std::span<const char *>
  Args() const noexcept
  {
    return std::span{ mArgs, mArgs + mArgCount };
  }

  std::unexpected<ParserError>
  Error(ParseErrorType type) noexcept
  {
    return std::unexpected(ParserError{ type, GetArgsCurrentlyBeingParsed() });
  }

private:
  std::vector<std::string_view>
  GetArgsCurrentlyBeingParsed() const noexcept
  {
    // always take the "current one" too, which may only have been partially parsed (due to inline values via
    // foo=bar)
    const auto end = std::min(mArgCount, mIndex + (mInsideInlineArgument ? 1 : 0));
    std::vector<std::string_view> result;
    for (auto i = mRememberedIndex; i < end; ++i) {
      result.emplace_back(mArgs[i]);
    }
    return result;
  }

  // Set before being passed to a parser function, so that the particular parser function does not have to
  // remember how many arguments it's parsed.
  void
  RememberPosition() noexcept
  {
    mRememberedIndex = mIndex;
  }

  int mArgCount;
  const char **mArgs;
  int mIndex{ 1 };
  std::optional<size_t> mInsideInlineArgument{};
  int mRememberedIndex{ 0 };
};

#ifndef TryExpected
#define TryExpected(iterator)                                                                                     \
  ({                                                                                                              \
    auto ___MAYBE_VALUE___ = iterator.GetNext();                                                                  \
    if (!___MAYBE_VALUE___) {                                                                                     \
      return iterator.Error(ParseErrorType::MissingArgValue);                                                     \
    }                                                                                                             \
    *___MAYBE_VALUE___;                                                                                           \
  })
#endif

struct OptionMetadata
{
  std::string mShortName;
  std::string mLongName;
  HelpMessage mInfo;
  bool mIsFlag;
};

template <typename ParseInput> struct IOption : OptionMetadata
{
  using Input = ParseInput;
  virtual std::expected<ParseOk, ParserError> Parse(ParseInput it) noexcept = 0;
  virtual void ApplyDefault() noexcept = 0;
  virtual ~IOption() noexcept = default;
};

template <typename T, typename U, typename ParseInput> class MemberOption : public IOption<ParseInput>
{
  using Data = OptionMetadata;
  using IBase = IOption<ParseInput>;

public:
  using MemberPtr = T U::*;
  using ParserFn = ParseResult<T> (*)(typename IBase::Input);

  MemberOption(std::string_view shortName,
    std::string_view longName,
    HelpMessage helpMessage,
    MemberPtr memberPointer,
    U *object,
    ParserFn parser,
    T defaultValue)
      : mMemberPointer(memberPointer), mObject(object), mParseFn(parser), mDefault(std::move(defaultValue))
  {
    Data::mShortName = shortName;
    Data::mLongName = longName;
    Data::mInfo = helpMessage;
    Data::mIsFlag = std::is_same_v<T, bool>;
  }

  std::expected<ParseOk, ParserError>
  Parse(ParseInput it) noexcept override
  {
    auto result = mParseFn(it);
    if (!result) {
      return std::unexpected(std::move(result.error()));
    }
    (*mObject).*mMemberPointer = std::move(result.value());
    return ParseOk{};
  }

  void
  ApplyDefault() noexcept override
  {
    (*mObject).*mMemberPointer = mDefault;
  }

private:
  MemberPtr mMemberPointer;
  U *mObject;
  ParserFn mParseFn;
  T mDefault;
};

struct CommandLineResult
{
  std::vector<ParserError> mErrors;

  bool
  Ok() const noexcept
  {
    return mErrors.empty();
  }
};

class CommandLineRegistry
{
  static constexpr auto UNIFORM_LINE_INDENT = 2;
  std::unordered_map<std::string_view, std::shared_ptr<IOption<ArgIterator &>>> mOptions;
  std::unordered_map<std::string_view, std::shared_ptr<IOption<std::string_view>>> mEnvironmentVariables;
  // Holds the length of the largest left-column when displaying using PrintHelp, i.e. "-c, --com <value>" for an
  // option that has both long and short form and is not a flag.
  size_t mLeftColumnDisplayWidth{ 0 };
  std::string mProgramName{ "dapc" };

  void
  AssertUnique(std::string_view shortName, std::string_view longName) noexcept
  {
    VERIFY(!shortName.empty() || !longName.empty(), "You've not given this option a name!");
    if (!longName.empty()) {
      VERIFY(mOptions.count(longName) == 0, "Already added option {}", longName);
    }

    if (!shortName.empty()) {
      VERIFY(mOptions.count(shortName) == 0, "Already added option {}", shortName);
    }
  }

  void
  UpdateLeftColumnWidth(bool isFlag, std::string_view shortName, std::string_view longName) noexcept
  {
    const auto leftColumnWidth =
      shortName.size() + longName.size() + (isFlag ? 0 : kValuePlaceHolder.size()) + UNIFORM_LINE_INDENT;

    mLeftColumnDisplayWidth = std::max(mLeftColumnDisplayWidth, leftColumnWidth);
  }

  template <typename Option>
  static std::vector<std::shared_ptr<Option>>
  Unique(const std::unordered_map<std::string_view, std::shared_ptr<Option>> &map) noexcept
  {
    std::vector<std::shared_ptr<Option>> result;
    result.reserve(map.size());

    std::unordered_set<const void *> taken{};

    for (const auto &[k, v] : map) {
      if (!taken.contains(v.get())) {
        result.push_back(v);
        taken.insert(v.get());
      }
    }
    return result;
  }

public:
  static constexpr auto kValuePlaceHolder = " <value> "sv;

  explicit CommandLineRegistry(std::string_view programName = "dapc") noexcept : mProgramName(programName) {}

  std::vector<std::shared_ptr<IOption<ArgIterator &>>>
  GetOptions() const noexcept
  {
    return Unique(mOptions);
  }

  std::vector<std::shared_ptr<IOption<std::string_view>>>
  GetEnvironmentVariableOptions() const noexcept
  {
    return Unique(mEnvironmentVariables);
  }

  template <typename T, typename U, typename ConvertibleToT>
  void
  AddOption(std::string_view shortName,
    std::string_view longName,
    HelpMessage message,
    T U::*member,
    U *object,
    typename MemberOption<T, U, ArgIterator &>::ParserFn parser,
    ConvertibleToT &&defaultVal) noexcept
    requires std::is_convertible_v<ConvertibleToT, T>
  {
    AssertUnique(shortName, longName);
    UpdateLeftColumnWidth(std::is_same_v<T, bool>, shortName, longName);

    std::shared_ptr<IOption<ArgIterator &>> opt = std::make_shared<MemberOption<T, U, ArgIterator &>>(
      shortName, longName, message, member, object, parser, T{ std::forward<ConvertibleToT>(defaultVal) });

    if (!shortName.empty()) {
      mOptions.emplace(shortName, opt);
    }

    if (!longName.empty()) {
      mOptions.emplace(longName, std::move(opt));
    }
  }

  template <typename T, typename U, typename ConvertibleToT>
  void
  AddEnvironmentVariable(std::string_view name,
    HelpMessage message,
    T U::*member,
    U *object,
    typename MemberOption<T, U, std::string_view>::ParserFn parser,
    ConvertibleToT &&defaultVal) noexcept
    requires std::is_convertible_v<ConvertibleToT, T>
  {
    VERIFY(mEnvironmentVariables.count(name) == 0, "Environment variable option already configured.");
    // Environment variable options have no short name.
    UpdateLeftColumnWidth(/* isFlag */ false, "", name);

    auto opt = std::make_shared<MemberOption<T, U, std::string_view>>(
      "", name, message, member, object, parser, T{ std::forward<ConvertibleToT>(defaultVal) });

    mEnvironmentVariables.emplace(name, std::move(opt));
  }

  CommandLineResult Parse(int argc, const char **argv) noexcept;
  void ParseEnvironmentVariableOptions() noexcept;

  void PrintHelp() const noexcept;
  void PrintHelpAbout(const OptionMetadata &option, u16 leftColumn, u16 rightColumn) const noexcept;
  std::pair<u16, u16> GetTerminalSize() const noexcept;
};

template <typename ResultType> struct FromTraits;

#define NumberTrait(NumberType)                                                                                   \
  template <> struct FromTraits<NumberType>                                                                       \
  {                                                                                                               \
    static ParseResult<NumberType>                                                                                \
    From(ArgIterator &it)                                                                                         \
    {                                                                                                             \
      auto arg = TryExpected(it);                                                                                 \
      if (const auto number = to_integral<NumberType>(arg); number) {                                             \
        return *number;                                                                                           \
      }                                                                                                           \
      return it.Error(ParseErrorType::InvalidFormat);                                                             \
    }                                                                                                             \
                                                                                                                  \
    static ParseResult<NumberType>                                                                                \
    From(std::string_view arg) noexcept                                                                           \
    {                                                                                                             \
      if (arg.empty())                                                                                            \
        return std::unexpected(ParserError{ ParseErrorType::MissingArgValue, {} });                               \
      if (const auto number = to_integral<NumberType>(arg); number) {                                             \
        return *number;                                                                                           \
      }                                                                                                           \
      return std::unexpected(ParserError{ ParseErrorType::InvalidFormat, { arg } });                              \
    }                                                                                                             \
  };

#define FOR_EACH_PRIMITIVE(PRIM)                                                                                  \
  PRIM(i32)                                                                                                       \
  PRIM(i64)                                                                                                       \
  PRIM(u32)                                                                                                       \
  PRIM(u64)

FOR_EACH_PRIMITIVE(NumberTrait);

template <> struct FromTraits<bool>
{
  // Flags take no value, their presence is the value.
  static ParseResult<bool>
  From(ArgIterator &) noexcept
  {
    return true;
  }
};

template <> struct FromTraits<std::string>
{
  static ParseResult<std::string>
  From(ArgIterator &it)
  {
    auto arg = TryExpected(it);
    return std::string{ arg };
  }
};

} // namespace dapc::cfg
