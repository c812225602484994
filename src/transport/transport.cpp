/** LICENSE TEMPLATE */
#include "transport.h"

// dependency
#include <fmt/core.h>

namespace dapc {

/* static */
std::string
AdapterTransport::CreateMessage(const Value &message) noexcept
{
  // Invalid UTF-8 in a string we were handed is replaced, not thrown on.
  const auto payload = message.dump(-1, ' ', false, nlohmann::detail::error_handler_t::replace);
  return fmt::format("Content-Length: {}\r\n\r\n{}", payload.size(), payload);
}

} // namespace dapc
