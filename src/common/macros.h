/** LICENSE TEMPLATE */
#pragma once
// dapc
#include <common/typedefs.h>

// stdlib
#include <array>
#include <optional>
#include <span>
#include <string_view>
#include <utility>

#if defined(__clang__)
#define DAPC_UNREACHABLE std::unreachable();
#elif defined(__GNUC__) || defined(__GNUG__)
#define DAPC_UNREACHABLE __builtin_unreachable();
#endif

#ifndef NO_COPY
/// Types that use NO_COPY in this codebase tend to be owned by exactly one place and handed out by reference or
/// pointer.
#define NO_COPY(CLASS)                                                                                            \
  CLASS(const CLASS &) = delete;                                                                                  \
  CLASS(CLASS &) = delete;                                                                                        \
  CLASS &operator=(CLASS &) = delete;                                                                             \
  CLASS &operator=(const CLASS &) = delete;
#endif

#ifndef NO_COPY_DEFAULTED_MOVE
#define NO_COPY_DEFAULTED_MOVE(CLASS)                                                                             \
  NO_COPY(CLASS)                                                                                                  \
  CLASS(CLASS &&) noexcept = default;                                                                             \
  CLASS &operator=(CLASS &&) noexcept = default;
#endif

// Enumerations in dapc are declared with an X-macro where each item is ITEM(Enumerator, "name"), the name being
// the exact spelling used on the wire (or in a log file name, or on the command line).
#define DEFAULT_ENUM(Value, ...) Value,
#define ENUM_NAME(Value, Name, ...) Name,

namespace dapc {
// Specialized for every enum declared with ENUM_TYPE_METADATA
template <typename T> struct Enum;

template <typename T>
concept HasEnumMetadata = std::is_enum_v<T> && requires(T value) { Enum<T>::ToString(value); };
} // namespace dapc

// Must be used at `dapc` namespace scope, where the primary `Enum` template lives.
#define PREDEFINED_ENUM_TYPE_METADATA(ENUM_TYPE, FOR_EACH)                                                        \
  template <> struct Enum<ENUM_TYPE>                                                                              \
  {                                                                                                               \
    static constexpr auto kNames = std::to_array<std::string_view>({ FOR_EACH(ENUM_NAME) });                      \
    static constexpr auto kIds = []() {                                                                           \
      std::array<ENUM_TYPE, kNames.size()> ids{};                                                                 \
      for (auto i = 0u; i < ids.size(); ++i) {                                                                    \
        ids[i] = static_cast<ENUM_TYPE>(i);                                                                       \
      }                                                                                                           \
      return ids;                                                                                                 \
    }();                                                                                                          \
                                                                                                                  \
    static constexpr u32                                                                                          \
    Count() noexcept                                                                                              \
    {                                                                                                             \
      return kIds.size();                                                                                         \
    }                                                                                                             \
                                                                                                                  \
    static constexpr std::span<const ENUM_TYPE>                                                                   \
    Variants() noexcept                                                                                           \
    {                                                                                                             \
      return std::span{ kIds };                                                                                   \
    }                                                                                                             \
                                                                                                                  \
    static constexpr std::span<const std::string_view>                                                            \
    Names() noexcept                                                                                              \
    {                                                                                                             \
      return std::span{ kNames };                                                                                 \
    }                                                                                                             \
                                                                                                                  \
    static constexpr std::string_view                                                                             \
    ToString(ENUM_TYPE value) noexcept                                                                            \
    {                                                                                                             \
      return kNames[std::to_underlying(value)];                                                                   \
    }                                                                                                             \
                                                                                                                  \
    static constexpr std::optional<ENUM_TYPE>                                                                     \
    FromString(std::string_view str) noexcept                                                                     \
    {                                                                                                             \
      auto index = 0u;                                                                                            \
      for (const auto &n : kNames) {                                                                              \
        if (n == str)                                                                                             \
          return kIds[index];                                                                                     \
        ++index;                                                                                                  \
      }                                                                                                           \
      return {};                                                                                                  \
    }                                                                                                             \
  };

// Enumerators are numbered from 0 so that `ToString` can index straight into the name table.
#define ENUM_TYPE_METADATA(ENUM_TYPE, FOR_EACH, UNDERLYING_TYPE)                                                  \
  enum class ENUM_TYPE : UNDERLYING_TYPE                                                                          \
  {                                                                                                               \
    FOR_EACH(DEFAULT_ENUM)                                                                                        \
  };                                                                                                              \
  PREDEFINED_ENUM_TYPE_METADATA(ENUM_TYPE, FOR_EACH)
