/** LICENSE TEMPLATE */
#pragma once
// dapc
#include <transport/adapter_process.h>
#include <transport/parse_buffer.h>
#include <transport/transport.h>

// std
#include <optional>
#include <string>
#include <vector>

namespace dapc {

// Talks to an adapter process over its stdin/stdout. Whatever the adapter writes to stderr is drained into the
// log so that it never blocks on a full pipe.
class PipeTransport final : public AdapterTransport
{
  AdapterProcess mProcess;
  // Bytes read from the adapter's stdout that are not yet consumed as a message.
  std::string mBuffer{};
  bool mEndOfStream{ false };
  bool mDebugConnection;

  // The first frame in the buffer if it can be consumed now: a complete message, or an oversized header that
  // will never become one.
  std::optional<ContentParse> FirstFrame() const noexcept;
  // Wait at most `timeoutMs` (-1 forever) for output from the adapter and buffer it.
  Result<void> ReadAvailable(int timeoutMs) noexcept;

public:
  PipeTransport(std::vector<std::string> adapterArgv, bool debugConnection) noexcept;
  ~PipeTransport() noexcept override = default;

  Result<void> Spawn() noexcept final;
  Result<int> Wait(Milliseconds grace) noexcept final;
  Result<void> WriteAll(std::string_view bytes) noexcept final;
  Result<bool> MessageExists(Milliseconds timeout) noexcept final;
  Result<Value> ReadMessage() noexcept final;

  const AdapterProcess &
  Process() const noexcept
  {
    return mProcess;
  }
};

} // namespace dapc
