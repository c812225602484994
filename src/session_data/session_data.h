/** LICENSE TEMPLATE */
#pragma once
// dapc
#include <common/macros.h>
#include <common/typedefs.h>
#include <protocol/error.h>
#include <protocol/types.h>
#include <session_data/string_storage.h>

// std
#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

namespace dapc {

class Session;

#define FOR_EACH_DEBUGGEE_STATUS(ITEM)                                                                            \
  ITEM(NotRunning, "not_running")                                                                                 \
  ITEM(Running, "running")                                                                                        \
  ITEM(Stopped, "stopped")                                                                                        \
  ITEM(Exited, "exited")

ENUM_TYPE_METADATA(DebuggeeStatus, FOR_EACH_DEBUGGEE_STATUS, u8)

#define FOR_EACH_THREAD_STATE(ITEM)                                                                               \
  ITEM(Unknown, "unknown")                                                                                        \
  ITEM(Stopped, "stopped")                                                                                        \
  ITEM(Continued, "continued")

ENUM_TYPE_METADATA(ThreadState, FOR_EACH_THREAD_STATE, u8)

struct ThreadStatus
{
  ThreadState mState{ ThreadState::Unknown };
  // The stopped event that named this thread. Not set for a thread that only stopped along with all the others.
  std::optional<StoppedEventBody> mStopped{};
};

// What we know about the debuggee, built up from the events and responses of a session. Every string held here
// is interned in `mStrings`, nothing points into a message.
class SessionData
{
  StringStorage mStrings{};
  // In the order the adapter announced them
  std::vector<Module> mModules{};
  std::vector<Thread> mThreads{};
  // Keyed by thread id. Kept apart from mThreads, which is replaced wholesale by every threads response.
  std::unordered_map<i64, ThreadStatus> mThreadStates{};
  DebuggeeStatus mStatus{ DebuggeeStatus::NotRunning };
  std::vector<OutputEventBody> mOutput{};
  std::optional<i64> mExitCode{};

public:
  SessionData() noexcept = default;
  NO_COPY_DEFAULTED_MOVE(SessionData);

  // Consume the oldest pending module event.
  Result<void> HandleEventModules(Session &session) noexcept;
  // Consume the response to the threads request `seq`.
  Result<void> HandleResponseThreads(Session &session, Seq seq) noexcept;
  Result<void> HandleEventOutput(Session &session) noexcept;
  Result<void> HandleEventExited(Session &session) noexcept;
  Result<void> HandleEventStopped(Session &session) noexcept;
  Result<void> HandleEventContinued(Session &session) noexcept;

  // Store a copy of `module` unless one with the same id is already stored. Returns whether it was stored.
  bool AddModule(const Module &module) noexcept;
  // Returns whether a module with `id` was stored.
  bool RemoveModule(const ModuleId &id) noexcept;
  // Replace all threads with copies of `threads`. Threads that are still around keep their state, the state of
  // the others is dropped.
  void SetThreads(std::span<const Thread> threads) noexcept;
  void SetStopped(const StoppedEventBody &stopped) noexcept;
  void SetContinued(const ContinuedEventBody &continued) noexcept;
  void SetContinuedAll() noexcept;
  // The session ended. An exit status, if there is one, is kept.
  void SetTerminated() noexcept;

  std::span<const Module>
  Modules() const noexcept
  {
    return mModules;
  }

  std::span<const Thread>
  Threads() const noexcept
  {
    return mThreads;
  }

  std::span<const OutputEventBody>
  Output() const noexcept
  {
    return mOutput;
  }

  DebuggeeStatus
  Status() const noexcept
  {
    return mStatus;
  }

  // nullptr for a thread we've heard nothing about
  const ThreadStatus *
  GetThreadStatus(i64 id) const noexcept
  {
    const auto it = mThreadStates.find(id);
    return it == mThreadStates.end() ? nullptr : &it->second;
  }

  std::optional<i64>
  ExitCode() const noexcept
  {
    return mExitCode;
  }

  const StringStorage &
  Strings() const noexcept
  {
    return mStrings;
  }
};

} // namespace dapc
