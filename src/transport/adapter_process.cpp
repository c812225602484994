/** LICENSE TEMPLATE */
#include "adapter_process.h"

// dapc
#include <common.h>
#include <utils/logger.h>

// std
#include <chrono>
#include <thread>

// system
#include <cerrno>
#include <csignal>
#include <cstring>
#include <sys/wait.h>
#include <unistd.h>

namespace dapc {

static constexpr Milliseconds kReapPollInterval{ 10 };

static int
ExitStatus(Pid pid, int status) noexcept
{
  if (WIFEXITED(status)) {
    DBGLOG(core, "adapter {} exited with {}", pid, WEXITSTATUS(status));
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    DBGLOG(core, "adapter {} terminated by signal {}", pid, WTERMSIG(status));
    return 128 + WTERMSIG(status);
  }
  return status;
}

AdapterProcess::AdapterProcess(std::vector<std::string> argv) noexcept : mArgv(std::move(argv))
{
  VERIFY(!mArgv.empty(), "An adapter needs a program to execute");
}

AdapterProcess::~AdapterProcess() noexcept
{
  if (!IsRunning()) {
    return;
  }
  // Nobody waited for it. Don't leave it behind as an orphan or a zombie.
  mStdin.Close();
  ::kill(mPid, SIGTERM);
  int status = 0;
  while (::waitpid(mPid, &status, 0) == -1 && errno == EINTR) {
  }
  DBGLOG(core, "adapter {} reaped on destruction", mPid);
}

Result<void>
AdapterProcess::Spawn() noexcept
{
  VERIFY(mPid == -1, "Adapter already spawned, pid={}", mPid);
  auto stdinPipe = TRY(Pipe::Create());
  auto stdoutPipe = TRY(Pipe::Create());
  auto stderrPipe = TRY(Pipe::Create());
  // Written to by the child only if execvp fails; closed by exec otherwise.
  auto execStatus = TRY(Pipe::Create());

  std::vector<char *> args{};
  args.reserve(mArgv.size() + 1);
  for (auto &arg : mArgv) {
    args.push_back(arg.data());
  }
  args.push_back(nullptr);

  const auto pid = ::fork();
  if (pid == -1) {
    return MakeError(ErrorCode::SpawnFailed, fmt::format("fork: {}", strerror(errno)));
  }

  if (pid == 0) {
    // Child. Only async-signal-safe calls from here on.
    if (::dup2(stdinPipe.mRead, STDIN_FILENO) == -1 || ::dup2(stdoutPipe.mWrite, STDOUT_FILENO) == -1 ||
        ::dup2(stderrPipe.mWrite, STDERR_FILENO) == -1) {
      const int err = errno;
      [[maybe_unused]] auto _ = ::write(execStatus.mWrite, &err, sizeof(err));
      ::_exit(127);
    }
    ::execvp(args[0], args.data());
    const int err = errno;
    [[maybe_unused]] auto _ = ::write(execStatus.mWrite, &err, sizeof(err));
    ::_exit(127);
  }

  execStatus.mWrite.Close();
  int childErrno = 0;
  ssize_t bytes;
  while ((bytes = ::read(execStatus.mRead, &childErrno, sizeof(childErrno))) == -1 && errno == EINTR) {
  }
  if (bytes > 0) {
    int status = 0;
    while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {
    }
    DBGLOG(core, "failed to exec {}: {}", mArgv[0], strerror(childErrno));
    return MakeError(ErrorCode::SpawnFailed, fmt::format("{}: {}", mArgv[0], strerror(childErrno)));
  }

  mPid = pid;
  mStdin = std::move(stdinPipe.mWrite);
  mStdout = std::move(stdoutPipe.mRead);
  mStderr = std::move(stderrPipe.mRead);
  DBGLOG(core, "spawned adapter {} with pid {}", mArgv[0], mPid);
  return {};
}

Result<int>
AdapterProcess::Wait(Milliseconds grace) noexcept
{
  VERIFY(mPid != -1, "Waiting for an adapter that was never spawned");
  if (mReaped) {
    return MakeError(ErrorCode::WaitFailed, fmt::format("adapter {} already reaped", mPid));
  }
  // An adapter reading its stdin until end of stream won't exit before we close it.
  mStdin.Close();

  // SIGTERM once `grace` has passed, SIGKILL if that didn't do it either after another `grace`.
  auto deadline = std::chrono::steady_clock::now() + grace;
  int nextSignal = SIGTERM;
  int status = 0;
  int options = WNOHANG;
  while (true) {
    const auto waited = ::waitpid(mPid, &status, options);
    if (waited == mPid) {
      break;
    }
    if (waited == -1) {
      if (errno == EINTR) {
        continue;
      }
      return MakeError(ErrorCode::WaitFailed, fmt::format("waitpid({}): {}", mPid, strerror(errno)));
    }
    if (std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(kReapPollInterval);
      continue;
    }
    DBGLOG(warning, "adapter {} still running after {}ms, sending {}", mPid, grace.count(),
      nextSignal == SIGTERM ? "SIGTERM" : "SIGKILL");
    if (::kill(mPid, nextSignal) == -1 && errno != ESRCH) {
      return MakeError(ErrorCode::WaitFailed, fmt::format("kill({}): {}", mPid, strerror(errno)));
    }
    if (nextSignal == SIGKILL) {
      options = 0;
    }
    nextSignal = SIGKILL;
    deadline = std::chrono::steady_clock::now() + grace;
  }
  mReaped = true;
  return ExitStatus(mPid, status);
}

Result<void>
AdapterProcess::WriteAll(std::string_view bytes) noexcept
{
  if (!mStdin.IsOpen()) {
    return MakeError(ErrorCode::WriteFailed, "adapter stdin is closed");
  }
  while (!bytes.empty()) {
    const auto written = ::write(mStdin, bytes.data(), bytes.size());
    if (written == -1) {
      if (errno == EINTR) {
        continue;
      }
      return MakeError(ErrorCode::WriteFailed, strerror(errno));
    }
    bytes.remove_prefix(static_cast<u64>(written));
  }
  return {};
}

/* static */
Result<u64>
AdapterProcess::Read(int fd, std::span<char> buffer) noexcept
{
  while (true) {
    const auto bytes = ::read(fd, buffer.data(), buffer.size());
    if (bytes >= 0) {
      return static_cast<u64>(bytes);
    }
    if (errno != EINTR) {
      return MakeError(ErrorCode::ReadFailed, strerror(errno));
    }
  }
}

} // namespace dapc
