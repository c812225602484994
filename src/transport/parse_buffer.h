/** LICENSE TEMPLATE */
#pragma once
// dapc
#include <common/typedefs.h>

// std
#include <regex>
#include <string_view>
#include <variant>
#include <vector>

namespace dapc {

// We've parsed the header of a message and we've verified that the body
// is contained in the buffer that we read into.
// - `mPayloadLength` is the length of the body
// - `mPacketOffset` is where the header starts, relative to the start of the buffer
// - `mPayloadBegin` points to the first byte of the body in the buffer
struct ContentDescriptor
{
  u64 mPayloadLength;
  u64 mPacketOffset;
  const char *mHeaderBegin;
  const char *mPayloadBegin;

  std::string_view Payload() const noexcept;
  // Offset one past the last byte of the body, relative to the start of the buffer
  u64 PacketEnd() const noexcept;
};

// We've parsed the header of a message, but we haven't read the entire body
// - `mPayloadMissing` is how much of the body that was missing (and needs to be added after the next read)
struct PartialContentDescriptor
{
  u64 mPayloadLength;
  u64 mPayloadMissing;
  const char *mPayloadBegin;
};

// A header whose Content-Length is larger than any message we accept, or doesn't fit in 64 bits. The body can't
// be trusted to follow, so the header is all that can be consumed.
// - `mHeaderLength` is the length of the "Content-Length: N\r\n\r\n" header
struct OversizedContentDescriptor
{
  std::string_view mLength;
  u64 mPacketOffset;
  u64 mHeaderLength;

  // Offset one past the header, relative to the start of the buffer
  u64
  HeaderEnd() const noexcept
  {
    return mPacketOffset + mHeaderLength;
  }
};

// data that we couldn't parse "Content-Length" header from, which probably means
// we only read about half of the header. It *must* be the last item found in the buffer.
struct RemainderData
{
  u64 mLength;
  u64 mOffset;
};

// Largest body a frame may announce
static constexpr u64 kMaxContentLength = 256ull * 1024 * 1024;

using ViewMatchResult = std::match_results<std::string_view::const_iterator>;
using ContentParse =
  std::variant<ContentDescriptor, PartialContentDescriptor, RemainderData, OversizedContentDescriptor>;

// Split `buffer` into the framed messages it holds. Complete messages come first, in order, followed by at most
// one partial message or chunk of remainder data. A header announcing more than kMaxContentLength bytes is
// reported as oversized and scanning resumes right after it. `allMessagesOk` is set if there was nothing but
// complete messages.
std::vector<ContentParse> ParseHeadersFrom(std::string_view buffer, bool *allMessagesOk = nullptr) noexcept;

} // namespace dapc
