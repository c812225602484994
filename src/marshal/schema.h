/** LICENSE TEMPLATE */
#pragma once

// std
#include <string_view>
#include <tuple>

namespace dapc {

// One entry in a type's field table: the name the field has on the wire and the member it is stored in.
template <typename Class, typename Member> struct Field
{
  using ClassType = Class;
  using MemberType = Member;

  std::string_view mName;
  Member Class::*mMember;
};

template <typename Class, typename Member>
constexpr Field<Class, Member>
MakeField(std::string_view name, Member Class::*member) noexcept
{
  return Field<Class, Member>{ name, member };
}

// Specialized for every protocol struct the marshaller should understand. A specialization exposes
//   static constexpr auto kFields = std::make_tuple(MakeField("wireName", &Type::mMember), ...);
// listing the fields in the order they are written on the wire.
template <typename T> struct Schema;

template <typename T>
concept HasSchema = requires { Schema<T>::kFields; };

// Call `fn(field)` for each entry in T's field table, in order.
template <HasSchema T, typename Fn>
constexpr void
ForEachField(Fn &&fn)
{
  std::apply([&fn](const auto &...field) { (fn(field), ...); }, Schema<T>::kFields);
}

} // namespace dapc
