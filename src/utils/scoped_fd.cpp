/** LICENSE TEMPLATE */
#include "scoped_fd.h"

// dapc
#include <common.h>
#include <utils/logger.h>

// system
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace dapc {

ScopedFd::ScopedFd() noexcept : mFd(-1) {}

ScopedFd::ScopedFd(int fd) noexcept : mFd(fd)
{
  VERIFY(fd != -1, "Taking ownership of a closed file or error file: {}", strerror(errno));
}

ScopedFd::ScopedFd(ScopedFd &&other) noexcept : mFd(other.mFd) { other.mFd = -1; }

ScopedFd &
ScopedFd::operator=(ScopedFd &&other) noexcept
{
  if (this == &other) {
    return *this;
  }
  Close();
  mFd = other.mFd;
  other.mFd = -1;
  return *this;
}

ScopedFd::~ScopedFd() noexcept { Close(); }

int
ScopedFd::Get() const noexcept
{
  return mFd;
}

bool
ScopedFd::IsOpen() const noexcept
{
  return mFd != -1;
}

void
ScopedFd::Close() noexcept
{
  if (mFd >= 0) {
    if (::close(mFd) != 0 && errno != EINTR && errno != EIO) {
      PANIC(fmt::format("Failed to close file descriptor {}: {}", mFd, strerror(errno)));
    }
  }
  mFd = -1;
}

ScopedFd::operator int() const noexcept { return Get(); }

int
ScopedFd::Release() noexcept
{
  const auto fd = mFd;
  mFd = -1;
  return fd;
}

/*static*/
ScopedFd
ScopedFd::TakeFileDescriptorOwnership(int fd) noexcept
{
  return ScopedFd{ fd };
}

/* static */
Result<Pipe>
Pipe::Create() noexcept
{
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) == -1) {
    DBGLOG(core, "pipe2 failed: {}", strerror(errno));
    return MakeError(ErrorCode::SpawnFailed, fmt::format("pipe2: {}", strerror(errno)));
  }
  return Pipe{ .mRead = ScopedFd{ fds[0] }, .mWrite = ScopedFd{ fds[1] } };
}

} // namespace dapc
