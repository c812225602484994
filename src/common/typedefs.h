/** LICENSE TEMPLATE */
#pragma once

// stdlib
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>
#include <type_traits>

// system
#include <sys/types.h>

using u64 = std::uint64_t;
using u32 = std::uint32_t;
using u16 = std::uint16_t;
using u8 = std::uint8_t;

using i64 = std::int64_t;
using i32 = std::int32_t;
using i16 = std::int16_t;
using i8 = std::int8_t;

using f32 = float;
using f64 = double;

using Pid = pid_t;

namespace fs = std::filesystem;
using Path = fs::path;

template <typename T> using Option = std::optional<T>;

// "remove_cvref_t" says nothing about what we want; `ActualType<T>` does.
template <typename T> using ActualType = std::remove_cvref_t<T>;

template <class... T> constexpr bool always_false = false;

template <typename T> struct IsOptional : std::false_type
{
};

template <typename T> struct IsOptional<std::optional<T>> : std::true_type
{
};

template <typename T> static inline constexpr bool IsOptionalType = IsOptional<ActualType<T>>::value;

// Sequence numbers of the debug adapter protocol.
using Seq = i32;

using Milliseconds = std::chrono::milliseconds;
