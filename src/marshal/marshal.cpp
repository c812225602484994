/** LICENSE TEMPLATE */
#include "marshal.h"

// dapc
#include <common.h>

namespace dapc {

Result<Value *>
ResolveAncestor(Value &object, std::string_view path) noexcept
{
  Value *current = &object;
  if (!current->is_object()) {
    return MakeError(ErrorCode::AncestorIsNotAnObject, "<root>");
  }

  while (!path.empty()) {
    const auto dot = path.find('.');
    const auto segment = path.substr(0, dot);
    path = dot == std::string_view::npos ? std::string_view{} : path.substr(dot + 1);

    const auto it = current->find(std::string{ segment });
    if (it == current->end()) {
      return MakeError(ErrorCode::AncestorDoesNotExist, std::string{ segment });
    }
    if (!it->is_object()) {
      return MakeError(ErrorCode::AncestorIsNotAnObject, std::string{ segment });
    }
    current = &*it;
  }
  return current;
}

Result<void>
InjectIntoAncestor(Value &object, std::string_view path, std::string_view key, Value value) noexcept
{
  Value *ancestor = TRY(ResolveAncestor(object, path));
  (*ancestor)[std::string{ key }] = std::move(value);
  return {};
}

void
Merge(Value &object, const Value &extra) noexcept
{
  VERIFY(object.is_object(), "merge target must be an object, was {}", object.type_name());
  VERIFY(extra.is_object(), "merged fields must be an object, was {}", extra.type_name());
  for (auto it = extra.begin(); it != extra.end(); ++it) {
    object[it.key()] = it.value();
  }
}

Result<void>
MergeIntoAncestor(Value &object, std::string_view path, const Value &extra) noexcept
{
  Value *ancestor = TRY(ResolveAncestor(object, path));
  Merge(*ancestor, extra);
  return {};
}

std::string_view
ScratchCloner::CloneString(std::string_view string) noexcept
{
  return mStrings.emplace_back(string);
}

void
ScratchCloner::Clear() noexcept
{
  mStrings.clear();
}

} // namespace dapc
