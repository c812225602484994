/** LICENSE TEMPLATE */
#include "session_data.h"

// dapc
#include <marshal/marshal.h>
#include <session/session.h>
#include <utils/logger.h>

// std
#include <algorithm>

namespace dapc {

// The body of a handled message, parsed as T. The parsed record views into the message. A body that doesn't parse
// marks the message as failed.
template <typename T>
static Result<T>
ParseBody(HandledMessage &handled) noexcept
{
  const Value *body = GetField(handled.mMessage, "body");
  if (!body) {
    handled.mSuccess = false;
    return MakeError(ErrorCode::MissingField, "body");
  }
  auto parsed = FromObject<T>(*body);
  if (!parsed) {
    handled.mSuccess = false;
    return std::unexpected{ detail::PrefixError("body", std::move(parsed.error())) };
  }
  return parsed;
}

Result<void>
SessionData::HandleEventModules(Session &session) noexcept
{
  auto *event = TRY(session.AcknowledgeEvent(Enum<EventKind>::ToString(EventKind::Module)));
  const auto body = TRY(ParseBody<ModuleEventBody>(*event));

  const auto *reason = maybe_unwrap<ModuleReason>(body.mReason);
  if (!reason) {
    DBGLOG(warning, "module event with unknown reason '{}'", std::get<std::string_view>(body.mReason));
    return {};
  }
  switch (*reason) {
  case ModuleReason::New:
  case ModuleReason::Changed:
    AddModule(body.mModule);
    break;
  case ModuleReason::Removed:
    RemoveModule(body.mModule.mId);
    break;
  }
  return {};
}

Result<void>
SessionData::HandleResponseThreads(Session &session, Seq seq) noexcept
{
  auto *response = TRY(session.AcknowledgeResponse(seq, Command::Threads));
  const auto body = TRY(ParseBody<ThreadsResponseBody>(*response));
  SetThreads(body.mThreads);
  return {};
}

Result<void>
SessionData::HandleEventOutput(Session &session) noexcept
{
  auto *event = TRY(session.AcknowledgeEvent(Enum<EventKind>::ToString(EventKind::Output)));
  const auto body = TRY(ParseBody<OutputEventBody>(*event));
  mOutput.push_back(DeepClone(mStrings, body));
  return {};
}

Result<void>
SessionData::HandleEventExited(Session &session) noexcept
{
  auto *event = TRY(session.AcknowledgeEvent(Enum<EventKind>::ToString(EventKind::Exited)));
  const auto body = TRY(ParseBody<ExitedEventBody>(*event));
  mExitCode = body.mExitCode;
  mStatus = DebuggeeStatus::Exited;
  DBGLOG(data, "debuggee exited with {}", body.mExitCode);
  return {};
}

Result<void>
SessionData::HandleEventStopped(Session &session) noexcept
{
  auto *event = TRY(session.AcknowledgeEvent(Enum<EventKind>::ToString(EventKind::Stopped)));
  const auto body = TRY(ParseBody<StoppedEventBody>(*event));
  SetStopped(body);
  return {};
}

Result<void>
SessionData::HandleEventContinued(Session &session) noexcept
{
  auto *event = TRY(session.AcknowledgeEvent(Enum<EventKind>::ToString(EventKind::Continued)));
  const auto body = TRY(ParseBody<ContinuedEventBody>(*event));
  SetContinued(body);
  return {};
}

bool
SessionData::AddModule(const Module &module) noexcept
{
  const auto exists =
    std::any_of(mModules.begin(), mModules.end(), [&module](const Module &m) { return m.mId == module.mId; });
  if (exists) {
    return false;
  }
  mModules.push_back(DeepClone(mStrings, module));
  DBGLOG(data, "module added: {}", module.mName);
  return true;
}

bool
SessionData::RemoveModule(const ModuleId &id) noexcept
{
  const auto erased = std::erase_if(mModules, [&id](const Module &m) { return m.mId == id; });
  return erased > 0;
}

void
SessionData::SetThreads(std::span<const Thread> threads) noexcept
{
  mThreads.clear();
  mThreads.reserve(threads.size());
  for (const auto &thread : threads) {
    mThreads.push_back(DeepClone(mStrings, thread));
  }
  std::erase_if(mThreadStates, [threads](const auto &entry) {
    return std::none_of(
      threads.begin(), threads.end(), [id = entry.first](const Thread &thread) { return thread.mId == id; });
  });
  DBGLOG(data, "threads: {}", mThreads.size());
}

void
SessionData::SetStopped(const StoppedEventBody &stopped) noexcept
{
  if (stopped.mThreadId) {
    mThreadStates[*stopped.mThreadId] =
      ThreadStatus{ .mState = ThreadState::Stopped, .mStopped = DeepClone(mStrings, stopped) };
  }
  if (stopped.mAllThreadsStopped.value_or(false)) {
    for (const auto &thread : mThreads) {
      mThreadStates.try_emplace(thread.mId);
    }
    for (auto &[id, status] : mThreadStates) {
      // A thread already stopped keeps the reason it stopped for
      if (status.mState != ThreadState::Stopped) {
        status = ThreadStatus{ .mState = ThreadState::Stopped, .mStopped = std::nullopt };
      }
    }
  }
  if (mStatus != DebuggeeStatus::Exited) {
    mStatus = DebuggeeStatus::Stopped;
  }
  DBGLOG(data, "stopped, thread={}", stopped.mThreadId.value_or(-1));
}

void
SessionData::SetContinued(const ContinuedEventBody &continued) noexcept
{
  mThreadStates[continued.mThreadId] = ThreadStatus{ .mState = ThreadState::Continued, .mStopped = std::nullopt };
  if (continued.mAllThreadsContinued.value_or(true)) {
    SetContinuedAll();
  }
  if (mStatus != DebuggeeStatus::Exited) {
    mStatus = DebuggeeStatus::Running;
  }
}

void
SessionData::SetContinuedAll() noexcept
{
  for (const auto &thread : mThreads) {
    mThreadStates.try_emplace(thread.mId);
  }
  for (auto &[id, status] : mThreadStates) {
    status = ThreadStatus{ .mState = ThreadState::Continued, .mStopped = std::nullopt };
  }
}

void
SessionData::SetTerminated() noexcept
{
  if (mStatus != DebuggeeStatus::Exited) {
    mStatus = DebuggeeStatus::NotRunning;
  }
}

} // namespace dapc
