/** LICENSE TEMPLATE */
#pragma once

// dapc
#include <common/macros.h>
#include <common/typedefs.h>
#include <marshal/schema.h>
#include <protocol/error.h>
#include <protocol/value.h>

// dependency
#include <fmt/core.h>

// std
#include <array>
#include <concepts>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

// Conversion between typed protocol records and the generic `Value` tree, driven by the `Schema<T>` field tables
// in protocol/types.h.
namespace dapc {

template <typename T> struct IsVector : std::false_type
{
};

template <typename T, typename Alloc> struct IsVector<std::vector<T, Alloc>> : std::true_type
{
};

template <typename T> struct IsVariant : std::false_type
{
};

template <typename... Ts> struct IsVariant<std::variant<Ts...>> : std::true_type
{
};

template <typename T> struct IsStdArray : std::false_type
{
};

template <typename T, size_t N> struct IsStdArray<std::array<T, N>> : std::true_type
{
};

template <typename T> static inline constexpr bool IsVectorType = IsVector<ActualType<T>>::value;
template <typename T> static inline constexpr bool IsVariantType = IsVariant<ActualType<T>>::value;

template <typename T>
concept StringLike = std::is_convertible_v<const T &, std::string_view> && !std::is_array_v<T>;

// Fixed size arrays and unions have no wire representation. Using one in a record is a mistake in the record,
// so it's caught at compile time.
template <typename T>
concept Unmarshallable = std::is_array_v<T> || IsStdArray<T>::value || std::is_union_v<T> || std::is_pointer_v<T>;

template <typename T>
Value
ToObject(const T &value)
{
  using Type = ActualType<T>;
  if constexpr (std::is_same_v<Type, Value>) {
    return value;
  } else if constexpr (std::is_same_v<Type, const char *> || std::is_same_v<Type, char *>) {
    return Value(std::string{ value });
  } else if constexpr (Unmarshallable<Type>) {
    static_assert(always_false<T>, "fixed size arrays, unions and pointers can not be marshalled");
  } else if constexpr (std::is_same_v<Type, bool>) {
    return Value(value);
  } else if constexpr (HasEnumMetadata<Type>) {
    return Value(std::string{ Enum<Type>::ToString(value) });
  } else if constexpr (std::is_arithmetic_v<Type>) {
    return Value(value);
  } else if constexpr (StringLike<Type>) {
    return Value(std::string{ std::string_view{ value } });
  } else if constexpr (IsOptionalType<Type>) {
    if (!value) {
      return Value(nullptr);
    }
    return ToObject(*value);
  } else if constexpr (IsVectorType<Type>) {
    Value array = Value::array();
    for (const auto &element : value) {
      array.push_back(ToObject(element));
    }
    return array;
  } else if constexpr (IsVariantType<Type>) {
    // An enum alternative writes its name, any other alternative is written as itself.
    return std::visit([](const auto &branch) { return ToObject(branch); }, value);
  } else if constexpr (HasSchema<Type>) {
    Value object = Value::object();
    ForEachField<Type>(
      [&](const auto &field) { object[std::string{ field.mName }] = ToObject(value.*(field.mMember)); });
    return object;
  } else {
    static_assert(always_false<T>, "type has no wire representation, add a Schema<T> specialization");
  }
}

namespace detail {
inline Error
PrefixError(std::string_view field, Error error) noexcept
{
  if (error.mDetail.empty()) {
    error.mDetail = std::string{ field };
  } else {
    error.mDetail = fmt::format("{}: {}", field, error.mDetail);
  }
  return error;
}
} // namespace detail

// Parse a typed record out of `value`. String fields of the result are views into `value`; it must outlive them.
template <typename T>
Result<T>
FromObject(const Value &value)
{
  using Type = ActualType<T>;
  if constexpr (std::is_same_v<Type, Value>) {
    return value;
  } else if constexpr (Unmarshallable<Type>) {
    static_assert(always_false<T>, "fixed size arrays, unions and pointers can not be marshalled");
  } else if constexpr (std::is_same_v<Type, bool>) {
    if (!value.is_boolean()) {
      return MakeError(ErrorCode::InvalidField, "expected boolean");
    }
    return value.get<bool>();
  } else if constexpr (HasEnumMetadata<Type>) {
    if (!value.is_string()) {
      return MakeError(ErrorCode::InvalidField, "expected enum name");
    }
    const auto &name = value.get_ref<const std::string &>();
    if (const auto parsed = Enum<Type>::FromString(name); parsed) {
      return *parsed;
    }
    return MakeError(ErrorCode::InvalidField, fmt::format("unknown name '{}'", name));
  } else if constexpr (std::is_integral_v<Type>) {
    if (!value.is_number_integer()) {
      return MakeError(ErrorCode::InvalidField, "expected integer");
    }
    if (value.is_number_unsigned()) {
      const auto number = value.get<u64>();
      if (!std::in_range<Type>(number)) {
        return MakeError(ErrorCode::InvalidField, fmt::format("{} out of range", number));
      }
      return static_cast<Type>(number);
    }
    const auto number = value.get<i64>();
    if (!std::in_range<Type>(number)) {
      return MakeError(ErrorCode::InvalidField, fmt::format("{} out of range", number));
    }
    return static_cast<Type>(number);
  } else if constexpr (std::is_floating_point_v<Type>) {
    if (!value.is_number()) {
      return MakeError(ErrorCode::InvalidField, "expected number");
    }
    return value.get<Type>();
  } else if constexpr (std::is_same_v<Type, std::string_view> || std::is_same_v<Type, std::string>) {
    if (!value.is_string()) {
      return MakeError(ErrorCode::InvalidField, "expected string");
    }
    return Type{ value.get_ref<const std::string &>() };
  } else if constexpr (IsOptionalType<Type>) {
    using Inner = typename Type::value_type;
    if (value.is_null()) {
      return Type{ std::nullopt };
    }
    auto inner = FromObject<Inner>(value);
    if (!inner) {
      return std::unexpected{ std::move(inner.error()) };
    }
    return Type{ std::move(*inner) };
  } else if constexpr (IsVectorType<Type>) {
    if (!value.is_array()) {
      return MakeError(ErrorCode::InvalidField, "expected array");
    }
    Type result{};
    result.reserve(value.size());
    for (auto i = 0u; i < value.size(); ++i) {
      auto element = FromObject<typename Type::value_type>(value[i]);
      if (!element) {
        return std::unexpected{ detail::PrefixError(fmt::format("[{}]", i), std::move(element.error())) };
      }
      result.push_back(std::move(*element));
    }
    return result;
  } else if constexpr (IsVariantType<Type>) {
    // Alternatives are tried in declaration order, the first one that parses wins.
    return [&value]<size_t... Is>(std::index_sequence<Is...>) -> Result<Type> {
      std::optional<Type> parsed{};
      (
        [&] {
          if (parsed) {
            return;
          }
          if (auto alternative = FromObject<std::variant_alternative_t<Is, Type>>(value); alternative) {
            parsed.emplace(std::in_place_index<Is>, std::move(*alternative));
          }
        }(),
        ...);
      if (!parsed) {
        return MakeError(ErrorCode::InvalidField, "matches no alternative");
      }
      return std::move(*parsed);
    }(std::make_index_sequence<std::variant_size_v<Type>>{});
  } else if constexpr (HasSchema<Type>) {
    if (!value.is_object()) {
      return MakeError(ErrorCode::InvalidField, "expected object");
    }
    Type result{};
    std::optional<Error> error{};
    ForEachField<Type>([&](const auto &field) {
      if (error) {
        return;
      }
      using MemberType = ActualType<decltype(result.*(field.mMember))>;
      const Value *member = GetField(value, field.mName);
      if (!member) {
        if constexpr (!IsOptionalType<MemberType>) {
          error = Error{ ErrorCode::MissingField, std::string{ field.mName } };
        }
        return;
      }
      if (auto parsed = FromObject<MemberType>(*member); parsed) {
        result.*(field.mMember) = std::move(*parsed);
      } else {
        error = detail::PrefixError(field.mName, std::move(parsed.error()));
      }
    });
    if (error) {
      return std::unexpected{ std::move(*error) };
    }
    return result;
  } else {
    static_assert(always_false<T>, "type has no wire representation, add a Schema<T> specialization");
  }
}

// Find the object at the dotted `path` below `object`. The empty path names `object` itself.
Result<Value *> ResolveAncestor(Value &object, std::string_view path) noexcept;

// Set `key` to `value` in the object found at the dotted `path`, overwriting what was there.
Result<void> InjectIntoAncestor(Value &object, std::string_view path, std::string_view key, Value value) noexcept;

// Overwrite the root level fields of `object` with those of `extra`. Both must be objects.
void Merge(Value &object, const Value &extra) noexcept;

// `Merge` into the object found at the dotted `path`.
Result<void> MergeIntoAncestor(Value &object, std::string_view path, const Value &extra) noexcept;

// Strategy for duplicating the strings of a record during a `DeepClone`. The returned view must stay valid for as
// long as the cloner does.
template <typename C>
concept Cloner = requires(C &cloner, std::string_view string) {
  { cloner.CloneString(string) } -> std::convertible_to<std::string_view>;
};

// Copies every string into storage of its own, no deduplication. For short lived copies.
class ScratchCloner
{
  std::deque<std::string> mStrings{};

public:
  ScratchCloner() noexcept = default;
  NO_COPY_DEFAULTED_MOVE(ScratchCloner);

  std::string_view CloneString(std::string_view string) noexcept;
  size_t
  Size() const noexcept
  {
    return mStrings.size();
  }
  void Clear() noexcept;
};

// Recursively copy `value`, re-pointing every string view at a copy made by `cloner`. The result has the same
// shape and the same active variant alternatives as `value`, and shares no string storage with it. Generic
// `Value` payloads, wherever they sit in the record, own their contents and are copied whole.
template <Cloner C, typename T>
T
DeepClone(C &cloner, const T &value)
{
  using Type = ActualType<T>;
  if constexpr (std::is_same_v<Type, std::string_view>) {
    return cloner.CloneString(value);
  } else if constexpr (std::is_same_v<Type, Value> || std::is_same_v<Type, std::string> ||
                       std::is_arithmetic_v<Type> || std::is_enum_v<Type>) {
    return value;
  } else if constexpr (Unmarshallable<Type>) {
    static_assert(always_false<T>, "fixed size arrays, unions and pointers can not be cloned");
  } else if constexpr (IsOptionalType<Type>) {
    if (!value) {
      return Type{ std::nullopt };
    }
    return Type{ DeepClone(cloner, *value) };
  } else if constexpr (IsVectorType<Type>) {
    Type result{};
    result.reserve(value.size());
    for (const auto &element : value) {
      result.push_back(DeepClone(cloner, element));
    }
    return result;
  } else if constexpr (IsVariantType<Type>) {
    return std::visit(
      [&cloner](const auto &branch) -> Type {
        using Branch = ActualType<decltype(branch)>;
        return Type{ std::in_place_type<Branch>, DeepClone(cloner, branch) };
      },
      value);
  } else if constexpr (HasSchema<Type>) {
    Type result{};
    ForEachField<Type>([&](const auto &field) { result.*(field.mMember) = DeepClone(cloner, value.*(field.mMember)); });
    return result;
  } else {
    static_assert(always_false<T>, "type can not be cloned, add a Schema<T> specialization");
  }
}

} // namespace dapc
