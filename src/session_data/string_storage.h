/** LICENSE TEMPLATE */
#pragma once
// dapc
#include <common/macros.h>
#include <common/typedefs.h>

// std
#include <functional>
#include <string>
#include <string_view>
#include <unordered_set>

namespace dapc {

struct StringHash
{
  using is_transparent = void;

  size_t
  operator()(std::string_view string) const noexcept
  {
    return std::hash<std::string_view>{}(string);
  }
};

// Append-only string interning. Every distinct string is stored once, and a view handed out stays valid for as
// long as the storage lives.
class StringStorage
{
  // Node based: elements don't move when the table grows.
  std::unordered_set<std::string, StringHash, std::equal_to<>> mStrings{};
  u64 mRequests{ 0 };

public:
  StringStorage() noexcept = default;
  NO_COPY_DEFAULTED_MOVE(StringStorage);

  // The stored copy of `string`, stored now if it wasn't already.
  std::string_view GetAndPut(std::string_view string) noexcept;

  // As a `Cloner` for DeepClone, interning every string of the cloned record.
  std::string_view
  CloneString(std::string_view string) noexcept
  {
    return GetAndPut(string);
  }

  bool Contains(std::string_view string) const noexcept;

  // Number of distinct strings stored
  size_t
  Size() const noexcept
  {
    return mStrings.size();
  }

  // Number of strings asked for, stored or not
  u64
  Requests() const noexcept
  {
    return mRequests;
  }
};

} // namespace dapc
