/** LICENSE TEMPLATE */
#include "pipe_transport.h"

// dapc
#include <common.h>
#include <utils/logger.h>

// std
#include <array>
#include <cerrno>
#include <cstring>

// system
#include <poll.h>

namespace dapc {

static constexpr auto kReadChunkSize = 4096u;

PipeTransport::PipeTransport(std::vector<std::string> adapterArgv, bool debugConnection) noexcept
    : mProcess(std::move(adapterArgv)), mDebugConnection(debugConnection)
{
}

Result<void>
PipeTransport::Spawn() noexcept
{
  return mProcess.Spawn();
}

Result<int>
PipeTransport::Wait(Milliseconds grace) noexcept
{
  return mProcess.Wait(grace);
}

Result<void>
PipeTransport::WriteAll(std::string_view bytes) noexcept
{
  CDLOG(mDebugConnection, dap, "--> {}", bytes);
  return mProcess.WriteAll(bytes);
}

std::optional<ContentParse>
PipeTransport::FirstFrame() const noexcept
{
  if (mBuffer.empty()) {
    return std::nullopt;
  }
  auto parsed = ParseHeadersFrom(mBuffer);
  if (parsed.empty()) {
    return std::nullopt;
  }
  auto &front = parsed.front();
  if (std::holds_alternative<ContentDescriptor>(front) || std::holds_alternative<OversizedContentDescriptor>(front)) {
    return std::move(front);
  }
  return std::nullopt;
}

Result<void>
PipeTransport::ReadAvailable(int timeoutMs) noexcept
{
  std::array<pollfd, 2> fds{ pollfd{ .fd = mProcess.StdoutFd(), .events = POLLIN, .revents = 0 },
    pollfd{ .fd = mProcess.StderrFd(), .events = POLLIN, .revents = 0 } };
  // A negative fd is skipped by poll, which is how a closed stderr drops out.
  const auto ready = ::poll(fds.data(), fds.size(), timeoutMs);
  if (ready == -1) {
    if (errno == EINTR) {
      return {};
    }
    return MakeError(ErrorCode::PollFailed, strerror(errno));
  }
  if (ready == 0) {
    return {};
  }

  std::array<char, kReadChunkSize> chunk;
  if (fds[1].revents != 0) {
    const auto bytes = TRY(AdapterProcess::Read(fds[1].fd, chunk));
    if (bytes == 0) {
      mProcess.CloseStderr();
    } else {
      DBGLOG(dap, "adapter stderr: {}", std::string_view{ chunk.data(), bytes });
    }
  }

  if (fds[0].revents != 0) {
    const auto bytes = TRY(AdapterProcess::Read(fds[0].fd, chunk));
    if (bytes == 0) {
      DBGLOG(core, "adapter {} closed its stdout", mProcess.GetPid());
      mEndOfStream = true;
    } else {
      mBuffer.append(chunk.data(), bytes);
    }
  }
  return {};
}

Result<bool>
PipeTransport::MessageExists(Milliseconds timeout) noexcept
{
  if (FirstFrame() || mEndOfStream) {
    return true;
  }
  TRY_VOID(ReadAvailable(static_cast<int>(timeout.count())));
  return FirstFrame().has_value() || mEndOfStream;
}

Result<Value>
PipeTransport::ReadMessage() noexcept
{
  auto frame = FirstFrame();
  while (!frame) {
    if (mEndOfStream) {
      return MakeError(ErrorCode::EndOfStream, fmt::format("adapter pid {}", mProcess.GetPid()));
    }
    TRY_VOID(ReadAvailable(-1));
    frame = FirstFrame();
  }

  if (const auto *oversized = maybe_unwrap<OversizedContentDescriptor>(*frame); oversized) {
    // Drop the header and pick up again at the next one.
    auto error = MakeError(ErrorCode::MalformedFrame, fmt::format("Content-Length: {}", oversized->mLength));
    mBuffer.erase(0, oversized->HeaderEnd());
    return error;
  }
  const auto *message = maybe_unwrap<ContentDescriptor>(*frame);

  const auto payload = message->Payload();
  CDLOG(mDebugConnection, dap, "<-- {}", payload);
  auto parsed = Value::parse(payload, nullptr, false);
  // The frame is consumed whether or not it parsed, a bad message doesn't block the ones after it.
  mBuffer.erase(0, message->PacketEnd());
  if (parsed.is_discarded()) {
    DBGLOG(warning, "Adapter sent a frame that is not JSON");
    return MakeError(ErrorCode::MalformedFrame);
  }
  return parsed;
}

} // namespace dapc
