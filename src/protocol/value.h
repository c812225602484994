/** LICENSE TEMPLATE */
#pragma once

// dapc
#include <common/typedefs.h>

// dependency
#include <nlohmann/json.hpp>

// std
#include <optional>
#include <string>
#include <string_view>

namespace dapc {
// The dynamically typed wire representation. Objects keep their keys in insertion order, so a message written
// by us reads in the same order as the typed value it was produced from.
using Value = nlohmann::ordered_json;

// Field lookups on a message. These never throw: a missing key, a non-object root, or a value of another kind
// all yield nullopt/nullptr.
inline const Value *
GetField(const Value &object, std::string_view key) noexcept
{
  if (!object.is_object()) {
    return nullptr;
  }
  const auto it = object.find(std::string{ key });
  return it == object.end() ? nullptr : &*it;
}

inline std::optional<i64>
GetInteger(const Value &object, std::string_view key) noexcept
{
  if (const auto *field = GetField(object, key); field && field->is_number_integer()) {
    return field->get<i64>();
  }
  return std::nullopt;
}

inline std::optional<std::string_view>
GetString(const Value &object, std::string_view key) noexcept
{
  if (const auto *field = GetField(object, key); field && field->is_string()) {
    return std::string_view{ field->get_ref<const std::string &>() };
  }
  return std::nullopt;
}

inline std::optional<bool>
GetBool(const Value &object, std::string_view key) noexcept
{
  if (const auto *field = GetField(object, key); field && field->is_boolean()) {
    return field->get<bool>();
  }
  return std::nullopt;
}
} // namespace dapc
