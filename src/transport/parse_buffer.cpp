/** LICENSE TEMPLATE */
#include "parse_buffer.h"

// dapc
#include <common.h>
#include <utils/logger.h>

namespace dapc {

static const std::regex CONTENT_LENGTH_HEADER = std::regex{ R"(Content-Length: (\d+)\r\n\r\n)" };

std::string_view
ContentDescriptor::Payload() const noexcept
{
  return std::string_view{ mPayloadBegin, mPayloadLength };
}

u64
ContentDescriptor::PacketEnd() const noexcept
{
  return mPacketOffset + static_cast<u64>(mPayloadBegin - mHeaderBegin) + mPayloadLength;
}

std::vector<ContentParse>
ParseHeadersFrom(std::string_view buffer, bool *allMessagesOk) noexcept
{
  std::vector<ContentParse> result{};

  std::string_view internalView{ buffer };
  ViewMatchResult baseMatch;
  bool partialFound = false;
  while (!internalView.empty() &&
         std::regex_search(internalView.begin(), internalView.end(), baseMatch, CONTENT_LENGTH_HEADER)) {
    if (baseMatch.size() != 2) {
      break;
    }
    const std::string_view lengthString{ baseMatch[1].first, baseMatch[1].second };
    const auto parsedLength = to_integral<u64>(lengthString);
    const u64 headerEnd = baseMatch.position() + baseMatch.length();
    const char *headerBegin = internalView.data() + baseMatch.position();
    const auto packetOffset = static_cast<u64>(headerBegin - buffer.data());
    if (!parsedLength || *parsedLength > kMaxContentLength) {
      DBGLOG(warning, "Content-Length {} is larger than {}", lengthString, kMaxContentLength);
      result.push_back(OversizedContentDescriptor{ .mLength = lengthString,
        .mPacketOffset = packetOffset,
        .mHeaderLength = static_cast<u64>(baseMatch.length()) });
      internalView.remove_prefix(headerEnd);
      partialFound = true;
      continue;
    }
    const auto length = *parsedLength;
    // headerEnd <= internalView.size(), the match is inside the view.
    const u64 available = internalView.size() - headerEnd;
    if (length <= available) {
      result.push_back(ContentDescriptor{ .mPayloadLength = length,
        .mPacketOffset = packetOffset,
        .mHeaderBegin = headerBegin,
        .mPayloadBegin = headerBegin + baseMatch.length() });
      internalView.remove_prefix(headerEnd + length);
    } else {
      result.push_back(PartialContentDescriptor{ .mPayloadLength = length,
        .mPayloadMissing = length - available,
        .mPayloadBegin = internalView.data() + headerEnd });
      internalView.remove_prefix(internalView.size());
      partialFound = true;
    }
  }
  if (!internalView.empty()) {
    const u64 offset = static_cast<u64>(internalView.data() - buffer.data());
    result.push_back(RemainderData{ .mLength = internalView.size(), .mOffset = offset });
    partialFound = true;
  }
  if (allMessagesOk != nullptr) {
    *allMessagesOk = !partialFound;
  }
  return result;
}

} // namespace dapc
