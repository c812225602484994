/** LICENSE TEMPLATE */
#pragma once
// dapc
#include <common/typedefs.h>
#include <protocol/error.h>
#include <protocol/value.h>

// std
#include <string>
#include <string_view>

namespace dapc {

// The connection to a debug adapter process: its lifecycle and its framed message stream. The session talks to
// the adapter only through this interface.
class AdapterTransport
{
public:
  virtual ~AdapterTransport() noexcept = default;

  virtual Result<void> Spawn() noexcept = 0;
  // Close the adapter's input and block until it has exited, return its exit status. An adapter that hasn't
  // exited after `grace` is sent SIGTERM.
  virtual Result<int> Wait(Milliseconds grace) noexcept = 0;
  virtual Result<void> WriteAll(std::string_view bytes) noexcept = 0;
  // Whether a call to `ReadMessage` would return without blocking; a complete message is buffered, or the
  // adapter has closed its output. Waits at most `timeout` for that to become true.
  virtual Result<bool> MessageExists(Milliseconds timeout) noexcept = 0;
  // The next message from the adapter. Fails with EndOfStream once the adapter has closed its output, and keeps
  // failing that way.
  virtual Result<Value> ReadMessage() noexcept = 0;

  // Frame `message` for the wire: Content-Length header followed by the compact JSON text.
  static std::string CreateMessage(const Value &message) noexcept;
};

} // namespace dapc
