/** LICENSE TEMPLATE */
#pragma once

#include <source_location>
#include <string_view>

// defines PANIC macro. Responsibility on caller to include required headers.

#define PANIC(err_msg)                                                                                            \
  {                                                                                                               \
    auto loc = std::source_location::current();                                                                   \
    dapc::panic(err_msg, loc, 1);                                                                                 \
  }

#define NEVER(msg)                                                                                                \
  PANIC(msg);                                                                                                     \
  DAPC_UNREACHABLE

#ifndef DAPC_UNREACHABLE

#if defined(__clang__)
#define DAPC_UNREACHABLE std::unreachable();
#elif defined(__GNUC__) || defined(__GNUG__)
#define DAPC_UNREACHABLE __builtin_unreachable();
#endif

#endif

namespace dapc {
[[noreturn]] void panic(std::string_view err_msg, const char *functionName, const char *file, int line,
                        int strip_levels);

[[noreturn]] void panic(std::string_view err_msg, const std::source_location &loc, int strip_levels);
} // namespace dapc
