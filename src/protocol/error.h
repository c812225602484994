/** LICENSE TEMPLATE */
#pragma once

// dapc
#include <common/macros.h>
#include <common/typedefs.h>

// dependency
#include <fmt/core.h>

// std
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace dapc {

// Every recoverable failure of the protocol, session and transport layers. Contract violations are not in here,
// those panic.
#define FOR_EACH_ERROR(ERR)                                                                                       \
  ERR(InvalidMessage, "Message is not an object or its \"type\" field is missing or not a string")                \
  ERR(UnknownMessage, "Message \"type\" is neither \"response\" nor \"event\"")                                   \
  ERR(EndOfStream, "The adapter closed its output stream")                                                        \
  ERR(MalformedFrame, "A framed message could not be parsed as JSON")                                             \
  ERR(InvalidSeqFromAdapter, "A sequence field sent by the adapter is not an integer")                            \
  ERR(ResponseDoesNotExist, "No pending response for the requested seq")                                          \
  ERR(EventDoesNotExist, "No pending event matches")                                                              \
  ERR(RequestFailed, "The adapter reported the request as failed")                                                \
  ERR(RequestResponseMismatchedSeq, "Response request_seq does not match the request's seq")                      \
  ERR(WrongCommandForResponse, "Response command does not match the request's command")                          \
  ERR(AdapterDoesNotSupportConfigurationDone, "Adapter did not declare supportsConfigurationDoneRequest")         \
  ERR(AdapterDoesNotSupportTerminate, "Adapter did not declare supportsTerminateRequest")                         \
  ERR(AdapterDoesNotSupportRequest, "Adapter did not declare support for the request")                            \
  ERR(SessionNotStarted, "The session has not been launched")                                                     \
  ERR(AncestorDoesNotExist, "A segment of the ancestor path does not exist")                                      \
  ERR(AncestorIsNotAnObject, "A segment of the ancestor path is not an object")                                   \
  ERR(InvalidField, "A field has the wrong type")                                                                 \
  ERR(MissingField, "A required field is missing")                                                                \
  ERR(SpawnFailed, "Failed to spawn the adapter process")                                                         \
  ERR(WriteFailed, "Failed to write to the adapter")                                                              \
  ERR(ReadFailed, "Failed to read from the adapter")                                                              \
  ERR(PollFailed, "Failed to poll the adapter's output")                                                          \
  ERR(WaitFailed, "Failed to wait for the adapter process")

#define ERROR_ENUM(Value, Description) Value,
#define ERROR_NAME(Value, Description) #Value,
#define ERROR_DESCRIPTION(Value, Description) Description,

enum class ErrorCode : u8
{
  FOR_EACH_ERROR(ERROR_ENUM)
};

namespace detail {
static constexpr std::string_view kErrorNames[]{ FOR_EACH_ERROR(ERROR_NAME) };
static constexpr std::string_view kErrorDescriptions[]{ FOR_EACH_ERROR(ERROR_DESCRIPTION) };
} // namespace detail

#undef ERROR_ENUM
#undef ERROR_NAME
#undef ERROR_DESCRIPTION

constexpr std::string_view
ToString(ErrorCode code) noexcept
{
  return detail::kErrorNames[std::to_underlying(code)];
}

constexpr std::string_view
Description(ErrorCode code) noexcept
{
  return detail::kErrorDescriptions[std::to_underlying(code)];
}

struct Error
{
  ErrorCode mCode;
  // What was being looked at when the error happened; a field name, a seq, an errno string.
  std::string mDetail{};

  operator std::unexpected<Error>() && noexcept { return std::unexpected<Error>(std::move(*this)); }

  std::string
  Message() const noexcept
  {
    if (mDetail.empty()) {
      return fmt::format("{}: {}", ToString(mCode), Description(mCode));
    }
    return fmt::format("{}: {} ({})", ToString(mCode), Description(mCode), mDetail);
  }
};

template <typename T> using Result = std::expected<T, Error>;

inline std::unexpected<Error>
MakeError(ErrorCode code, std::string detail = {}) noexcept
{
  return std::unexpected<Error>(Error{ code, std::move(detail) });
}

} // namespace dapc

// Evaluate `expr` (a Result<T>), return its error from the enclosing function if it has one, else yield its value.
#define TRY(expr)                                                                                                 \
  ({                                                                                                              \
    auto &&___RESULT___ = (expr);                                                                                 \
    if (!___RESULT___) {                                                                                          \
      return std::unexpected(std::move(___RESULT___.error()));                                                    \
    }                                                                                                             \
    std::move(*___RESULT___);                                                                                     \
  })

// TRY for Result<void>
#define TRY_VOID(expr)                                                                                            \
  if (auto ___RESULT___ = (expr); !___RESULT___) {                                                                \
    return std::unexpected(std::move(___RESULT___.error()));                                                      \
  }
