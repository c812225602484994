/** LICENSE TEMPLATE */
#pragma once

// dapc
#include <common/macros.h>
#include <common/typedefs.h>
#include <marshal/schema.h>
#include <protocol/dap_defs.h>
#include <protocol/value.h>

// std
#include <optional>
#include <string_view>
#include <tuple>
#include <variant>
#include <vector>

// Typed records of the debug adapter protocol. String fields are views; a record parsed from a message borrows
// from that message, and a record stored anywhere long-lived must first be deep-cloned into storage that outlives
// it (see marshal/marshal.h).
namespace dapc {

#define FOR_EACH_PATH_FORMAT(ITEM)                                                                                \
  ITEM(Path, "path")                                                                                              \
  ITEM(Uri, "uri")

ENUM_TYPE_METADATA(PathFormat, FOR_EACH_PATH_FORMAT, u8)

#define FOR_EACH_CHECKSUM_ALGORITHM(ITEM)                                                                         \
  ITEM(MD5, "MD5")                                                                                                \
  ITEM(SHA1, "SHA1")                                                                                              \
  ITEM(SHA256, "SHA256")                                                                                          \
  ITEM(Timestamp, "timestamp")

ENUM_TYPE_METADATA(ChecksumAlgorithm, FOR_EACH_CHECKSUM_ALGORITHM, u8)

#define FOR_EACH_COLUMN_TYPE(ITEM)                                                                                \
  ITEM(String, "string")                                                                                          \
  ITEM(Number, "number")                                                                                          \
  ITEM(Boolean, "boolean")                                                                                        \
  ITEM(UnixTimestampUTC, "unixTimestampUTC")

ENUM_TYPE_METADATA(ColumnType, FOR_EACH_COLUMN_TYPE, u8)

#define FOR_EACH_BREAKPOINT_MODE_APPLICABILITY(ITEM)                                                              \
  ITEM(Source, "source")                                                                                          \
  ITEM(Exception, "exception")                                                                                    \
  ITEM(Data, "data")                                                                                              \
  ITEM(Instruction, "instruction")

ENUM_TYPE_METADATA(BreakpointModeApplicability, FOR_EACH_BREAKPOINT_MODE_APPLICABILITY, u8)

#define FOR_EACH_MODULE_REASON(ITEM)                                                                              \
  ITEM(New, "new")                                                                                                \
  ITEM(Changed, "changed")                                                                                        \
  ITEM(Removed, "removed")

ENUM_TYPE_METADATA(ModuleReason, FOR_EACH_MODULE_REASON, u8)

#define FOR_EACH_STOPPED_REASON(ITEM)                                                                             \
  ITEM(Step, "step")                                                                                              \
  ITEM(Breakpoint, "breakpoint")                                                                                  \
  ITEM(Exception, "exception")                                                                                    \
  ITEM(Pause, "pause")                                                                                            \
  ITEM(Entry, "entry")                                                                                            \
  ITEM(Goto, "goto")                                                                                              \
  ITEM(FunctionBreakpoint, "function breakpoint")                                                                 \
  ITEM(DataBreakpoint, "data breakpoint")                                                                         \
  ITEM(InstructionBreakpoint, "instruction breakpoint")

ENUM_TYPE_METADATA(StoppedReason, FOR_EACH_STOPPED_REASON, u8)

#define FOR_EACH_OUTPUT_CATEGORY(ITEM)                                                                            \
  ITEM(Console, "console")                                                                                        \
  ITEM(Important, "important")                                                                                    \
  ITEM(Stdout, "stdout")                                                                                          \
  ITEM(Stderr, "stderr")                                                                                          \
  ITEM(Telemetry, "telemetry")

ENUM_TYPE_METADATA(OutputCategory, FOR_EACH_OUTPUT_CATEGORY, u8)

// The protocol leaves most of its enumerations open: a known name, or any other string.
template <typename E> using OpenEnum = std::variant<E, std::string_view>;

struct InitializeRequestArguments
{
  std::optional<std::string_view> mClientId;
  std::optional<std::string_view> mClientName;
  std::string_view mAdapterId;
  std::optional<std::string_view> mLocale;
  std::optional<bool> mLinesStartAt1;
  std::optional<bool> mColumnsStartAt1;
  std::optional<OpenEnum<PathFormat>> mPathFormat;
  std::optional<bool> mSupportsVariableType;
  std::optional<bool> mSupportsVariablePaging;
  std::optional<bool> mSupportsRunInTerminalRequest;
  std::optional<bool> mSupportsMemoryReferences;
  std::optional<bool> mSupportsProgressReporting;
  std::optional<bool> mSupportsInvalidatedEvent;
  std::optional<bool> mSupportsMemoryEvent;
  std::optional<bool> mSupportsArgsCanBeInterpretedByShell;
  std::optional<bool> mSupportsStartDebuggingRequest;
  std::optional<bool> mSupportsANSIStyling;
};

struct LaunchRequestArguments
{
  std::optional<bool> mNoDebug;
  // __restart, the opaque payload of a previous terminated event
  std::optional<Value> mRestart;
};

// configurationDone takes no arguments of its own; anything an adapter wants goes in the extra fields.
struct ConfigurationDoneArguments
{
};

struct TerminateArguments
{
  std::optional<bool> mRestart;
};

struct DisconnectArguments
{
  std::optional<bool> mRestart;
  std::optional<bool> mTerminateDebuggee;
  std::optional<bool> mSuspendDebuggee;
};

// threads has no arguments at all, the request carries none.
struct ThreadsArguments
{
};

struct ExceptionBreakpointsFilter
{
  std::string_view mFilter;
  std::string_view mLabel;
  std::optional<std::string_view> mDescription;
  std::optional<bool> mDefault;
  std::optional<bool> mSupportsCondition;
  std::optional<std::string_view> mConditionDescription;
};

struct ColumnDescriptor
{
  std::string_view mAttributeName;
  std::string_view mLabel;
  std::optional<std::string_view> mFormat;
  std::optional<ColumnType> mType;
  std::optional<i64> mWidth;
};

struct BreakpointMode
{
  std::string_view mMode;
  std::string_view mLabel;
  std::optional<std::string_view> mDescription;
  std::vector<OpenEnum<BreakpointModeApplicability>> mAppliesTo;
};

using ModuleId = std::variant<i64, std::string_view>;

struct Module
{
  ModuleId mId;
  std::string_view mName;
  std::optional<std::string_view> mPath;
  std::optional<bool> mIsOptimized;
  std::optional<bool> mIsUserCode;
  std::optional<std::string_view> mVersion;
  std::optional<std::string_view> mSymbolStatus;
  std::optional<std::string_view> mSymbolFilePath;
  std::optional<std::string_view> mDateTimeStamp;
  std::optional<std::string_view> mAddressRange;
};

struct Thread
{
  i64 mId;
  std::string_view mName;
};

struct ModuleEventBody
{
  OpenEnum<ModuleReason> mReason;
  Module mModule;
};

struct TerminatedEventBody
{
  std::optional<Value> mRestart;
};

struct ExitedEventBody
{
  i64 mExitCode;
};

struct OutputEventBody
{
  std::optional<OpenEnum<OutputCategory>> mCategory;
  std::string_view mOutput;
};

struct StoppedEventBody
{
  OpenEnum<StoppedReason> mReason;
  std::optional<std::string_view> mDescription;
  std::optional<i64> mThreadId;
  std::optional<std::string_view> mText;
  std::optional<bool> mAllThreadsStopped;
  std::optional<std::vector<i64>> mHitBreakpointIds;
};

struct ContinuedEventBody
{
  i64 mThreadId;
  // Absent means all threads
  std::optional<bool> mAllThreadsContinued;
};

struct ThreadsResponseBody
{
  std::vector<Thread> mThreads;
};

// The envelope of every request we send.
template <typename Arguments> struct Request
{
  Seq mSeq;
  MessageType mType;
  Command mCommand;
  Arguments mArguments;
};

template <> struct Schema<InitializeRequestArguments>
{
  using T = InitializeRequestArguments;
  static constexpr auto kFields = std::make_tuple(MakeField("clientID", &T::mClientId),
    MakeField("clientName", &T::mClientName),
    MakeField("adapterID", &T::mAdapterId),
    MakeField("locale", &T::mLocale),
    MakeField("linesStartAt1", &T::mLinesStartAt1),
    MakeField("columnsStartAt1", &T::mColumnsStartAt1),
    MakeField("pathFormat", &T::mPathFormat),
    MakeField("supportsVariableType", &T::mSupportsVariableType),
    MakeField("supportsVariablePaging", &T::mSupportsVariablePaging),
    MakeField("supportsRunInTerminalRequest", &T::mSupportsRunInTerminalRequest),
    MakeField("supportsMemoryReferences", &T::mSupportsMemoryReferences),
    MakeField("supportsProgressReporting", &T::mSupportsProgressReporting),
    MakeField("supportsInvalidatedEvent", &T::mSupportsInvalidatedEvent),
    MakeField("supportsMemoryEvent", &T::mSupportsMemoryEvent),
    MakeField("supportsArgsCanBeInterpretedByShell", &T::mSupportsArgsCanBeInterpretedByShell),
    MakeField("supportsStartDebuggingRequest", &T::mSupportsStartDebuggingRequest),
    MakeField("supportsANSIStyling", &T::mSupportsANSIStyling));
};

template <> struct Schema<LaunchRequestArguments>
{
  using T = LaunchRequestArguments;
  static constexpr auto kFields = std::make_tuple(MakeField("noDebug", &T::mNoDebug), MakeField("__restart", &T::mRestart));
};

template <> struct Schema<ConfigurationDoneArguments>
{
  static constexpr auto kFields = std::make_tuple();
};

template <> struct Schema<ThreadsArguments>
{
  static constexpr auto kFields = std::make_tuple();
};

template <> struct Schema<TerminateArguments>
{
  static constexpr auto kFields = std::make_tuple(MakeField("restart", &TerminateArguments::mRestart));
};

template <> struct Schema<DisconnectArguments>
{
  using T = DisconnectArguments;
  static constexpr auto kFields = std::make_tuple(MakeField("restart", &T::mRestart),
    MakeField("terminateDebuggee", &T::mTerminateDebuggee),
    MakeField("suspendDebuggee", &T::mSuspendDebuggee));
};

template <> struct Schema<ExceptionBreakpointsFilter>
{
  using T = ExceptionBreakpointsFilter;
  static constexpr auto kFields = std::make_tuple(MakeField("filter", &T::mFilter),
    MakeField("label", &T::mLabel),
    MakeField("description", &T::mDescription),
    MakeField("default", &T::mDefault),
    MakeField("supportsCondition", &T::mSupportsCondition),
    MakeField("conditionDescription", &T::mConditionDescription));
};

template <> struct Schema<ColumnDescriptor>
{
  using T = ColumnDescriptor;
  static constexpr auto kFields = std::make_tuple(MakeField("attributeName", &T::mAttributeName),
    MakeField("label", &T::mLabel),
    MakeField("format", &T::mFormat),
    MakeField("type", &T::mType),
    MakeField("width", &T::mWidth));
};

template <> struct Schema<BreakpointMode>
{
  using T = BreakpointMode;
  static constexpr auto kFields = std::make_tuple(MakeField("mode", &T::mMode),
    MakeField("label", &T::mLabel),
    MakeField("description", &T::mDescription),
    MakeField("appliesTo", &T::mAppliesTo));
};

template <> struct Schema<Module>
{
  using T = Module;
  static constexpr auto kFields = std::make_tuple(MakeField("id", &T::mId),
    MakeField("name", &T::mName),
    MakeField("path", &T::mPath),
    MakeField("isOptimized", &T::mIsOptimized),
    MakeField("isUserCode", &T::mIsUserCode),
    MakeField("version", &T::mVersion),
    MakeField("symbolStatus", &T::mSymbolStatus),
    MakeField("symbolFilePath", &T::mSymbolFilePath),
    MakeField("dateTimeStamp", &T::mDateTimeStamp),
    MakeField("addressRange", &T::mAddressRange));
};

template <> struct Schema<Thread>
{
  static constexpr auto kFields = std::make_tuple(MakeField("id", &Thread::mId), MakeField("name", &Thread::mName));
};

template <> struct Schema<ModuleEventBody>
{
  static constexpr auto kFields =
    std::make_tuple(MakeField("reason", &ModuleEventBody::mReason), MakeField("module", &ModuleEventBody::mModule));
};

template <> struct Schema<TerminatedEventBody>
{
  static constexpr auto kFields = std::make_tuple(MakeField("restart", &TerminatedEventBody::mRestart));
};

template <> struct Schema<ExitedEventBody>
{
  static constexpr auto kFields = std::make_tuple(MakeField("exitCode", &ExitedEventBody::mExitCode));
};

template <> struct Schema<OutputEventBody>
{
  static constexpr auto kFields =
    std::make_tuple(MakeField("category", &OutputEventBody::mCategory), MakeField("output", &OutputEventBody::mOutput));
};

template <> struct Schema<StoppedEventBody>
{
  using T = StoppedEventBody;
  static constexpr auto kFields = std::make_tuple(MakeField("reason", &T::mReason),
    MakeField("description", &T::mDescription),
    MakeField("threadId", &T::mThreadId),
    MakeField("text", &T::mText),
    MakeField("allThreadsStopped", &T::mAllThreadsStopped),
    MakeField("hitBreakpointIds", &T::mHitBreakpointIds));
};

template <> struct Schema<ContinuedEventBody>
{
  using T = ContinuedEventBody;
  static constexpr auto kFields =
    std::make_tuple(MakeField("threadId", &T::mThreadId), MakeField("allThreadsContinued", &T::mAllThreadsContinued));
};

template <> struct Schema<ThreadsResponseBody>
{
  static constexpr auto kFields = std::make_tuple(MakeField("threads", &ThreadsResponseBody::mThreads));
};

template <typename Arguments> struct Schema<Request<Arguments>>
{
  using T = Request<Arguments>;
  static constexpr auto kFields = std::make_tuple(MakeField("seq", &T::mSeq),
    MakeField("type", &T::mType),
    MakeField("command", &T::mCommand),
    MakeField("arguments", &T::mArguments));
};

} // namespace dapc
