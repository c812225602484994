/** LICENSE TEMPLATE */
#pragma once
// dapc
#include <common/macros.h>
#include <common/typedefs.h>
#include <protocol/error.h>

namespace dapc {

// Owns one file descriptor, closed on destruction.
class ScopedFd
{
public:
  ScopedFd() noexcept;
  explicit ScopedFd(int fd) noexcept;
  ScopedFd &operator=(ScopedFd &&other) noexcept;
  ScopedFd(ScopedFd &&) noexcept;
  ~ScopedFd() noexcept;
  NO_COPY(ScopedFd);

  int Get() const noexcept;
  bool IsOpen() const noexcept;
  void Close() noexcept;
  operator int() const noexcept;

  // Give up ownership without closing.
  int Release() noexcept;

  static ScopedFd TakeFileDescriptorOwnership(int fd) noexcept;

private:
  int mFd;
};

struct Pipe
{
  ScopedFd mRead;
  ScopedFd mWrite;

  // Both ends are close-on-exec, a child keeps only what it dup2's.
  static Result<Pipe> Create() noexcept;
};

} // namespace dapc
