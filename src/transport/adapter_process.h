/** LICENSE TEMPLATE */
#pragma once
// dapc
#include <common/macros.h>
#include <common/typedefs.h>
#include <protocol/error.h>
#include <utils/scoped_fd.h>

// std
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace dapc {

// A debug adapter running as a child process, with its standard streams connected to us through pipes.
class AdapterProcess
{
  std::vector<std::string> mArgv;
  Pid mPid{ -1 };
  bool mReaped{ false };
  ScopedFd mStdin{};
  ScopedFd mStdout{};
  ScopedFd mStderr{};

public:
  explicit AdapterProcess(std::vector<std::string> argv) noexcept;
  ~AdapterProcess() noexcept;
  NO_COPY(AdapterProcess);

  // fork and execvp `argv`. Fails if the program could not be executed.
  Result<void> Spawn() noexcept;
  // Close our end of the adapter's stdin and reap it. If it is still running after `grace`, SIGTERM it.
  Result<int> Wait(Milliseconds grace) noexcept;
  Result<void> WriteAll(std::string_view bytes) noexcept;

  // Read what is available from `fd`, up to `buffer.size()` bytes. 0 means end of stream.
  static Result<u64> Read(int fd, std::span<char> buffer) noexcept;

  bool
  IsRunning() const noexcept
  {
    return mPid != -1 && !mReaped;
  }

  Pid
  GetPid() const noexcept
  {
    return mPid;
  }

  int
  StdoutFd() const noexcept
  {
    return mStdout.Get();
  }

  int
  StderrFd() const noexcept
  {
    return mStderr.Get();
  }

  // Stop watching stderr, once it has reached end of stream.
  void
  CloseStderr() noexcept
  {
    mStderr.Close();
  }

  std::span<const std::string>
  Argv() const noexcept
  {
    return mArgv;
  }
};

} // namespace dapc
