/** LICENSE TEMPLATE */
#pragma once
// dapc
#include <common/macros.h>
#include <common/panic.h>
#include <common/typedefs.h>

// dependency
#include <fmt/core.h>

// stdlib
#include <charconv>
#include <concepts>
#include <optional>
#include <source_location>
#include <string_view>
#include <variant>

// clang-format off
// Identical to DAPC_ASSERT, but doesn't care about build type
#define VERIFY(cond, msg, ...) if (!(cond)) [[unlikely]] { std::source_location loc = std::source_location::current(); \
    dapc::panic(fmt::format("{} FAILED {}", #cond, fmt::format(msg __VA_OPT__(, ) __VA_ARGS__)), loc, 1);         \
  }
// clang-format on
#if defined(DAPC_DEBUG) and DAPC_DEBUG == 1
#define DAPC_ASSERT(cond, msg, ...) VERIFY(cond, msg __VA_OPT__(, ) __VA_ARGS__)
#else
#define DAPC_ASSERT(cond, msg, ...)
#endif

template <typename T, typename... Args>
constexpr const T *
maybe_unwrap(const std::variant<Args...> &variant) noexcept
{
  return std::get_if<T>(&variant);
}

template <std::integral Value>
constexpr Option<Value>
to_integral(std::string_view s)
{
  if (Value value; std::from_chars(s.data(), s.data() + s.size(), value).ec == std::errc{}) {
    return value;
  } else {
    return std::nullopt;
  }
}
