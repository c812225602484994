/** LICENSE TEMPLATE */
#include "string_storage.h"

namespace dapc {

std::string_view
StringStorage::GetAndPut(std::string_view string) noexcept
{
  ++mRequests;
  if (const auto it = mStrings.find(string); it != mStrings.end()) {
    return *it;
  }
  const auto [it, inserted] = mStrings.emplace(string);
  return *it;
}

bool
StringStorage::Contains(std::string_view string) const noexcept
{
  return mStrings.find(string) != mStrings.end();
}

} // namespace dapc
