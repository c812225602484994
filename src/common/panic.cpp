/** LICENSE TEMPLATE */
#include "panic.h"

// dapc
#include <utils/logger.h>

// dependency
#include <fmt/core.h>

// stdlib
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <regex>
#include <string>

// system
#include <cxxabi.h>
#include <execinfo.h>

namespace dapc {
template <typename T>
void
replace_regex(T &str)
{
  static const std::regex str_view_regex("std::basic_string_view<char, std::char_traits<char> >");
  static const std::regex str_regex{
    "std::__cxx11::basic_string<char, std::char_traits<char>, std::allocator<char> >"
  };
  static const std::regex allocator_regex{ ", std::allocator<.*> " };

  const std::string replacement = "std::string_view";
  str = std::regex_replace(str, str_view_regex, replacement);

  const std::string str_replacement = "std::string";
  str = std::regex_replace(str, str_regex, str_replacement);

  const std::string allocator_replacement = "";
  str = std::regex_replace(str, allocator_regex, allocator_replacement);
}

static void
sanitize(std::string &name)
{
  replace_regex(name);
}

// SIGTRAP first, so that a debugger attached to dapc stops right at the panic site.
[[noreturn]] static void
panic_exit()
{
  raise(SIGTRAP);
  std::abort();
}

[[noreturn]] void
panic(std::string_view err_msg, const char *functionName, const char *file, int line, int strip_levels)
{
  constexpr auto logIf = [](std::string_view msg) { logging::Logger::LogIf(Channel::core, msg); };
  constexpr auto BT_BUF_SIZE = 100;
  // errno may be clobbered by the backtrace machinery
  const auto savedErrno = errno;
  void *buffer[BT_BUF_SIZE];
  const int nptrs = backtrace(buffer, BT_BUF_SIZE);
  logIf(fmt::format("backtrace() returned {} addresses", nptrs));
  fmt::print("backtrace() returned {} addresses\n", nptrs);

  char **strings = backtrace_symbols(buffer, nptrs);
  if (strings == nullptr) {
    perror("backtrace_symbols");
  } else {
    for (int j = strip_levels; j < nptrs; j++) {
      auto demangle_len = 0ul;
      int stat = 0;
      std::string_view view{ strings[j] };
      if (const auto p = view.find("_Z"); p != std::string_view::npos) {
        view.remove_prefix(p);
        if (const auto plus = view.find_first_of('+'); plus != std::string_view::npos) {
          view.remove_suffix(view.size() - plus);
        }
        std::string copy{ view };
        if (char *res = __cxxabiv1::__cxa_demangle(copy.data(), nullptr, &demangle_len, &stat); stat == 0) {
          std::string demangled{ res };
          free(res);
          sanitize(demangled);
          logIf(demangled);
          fmt::print("{}\n", demangled);
          continue;
        }
      }
      logIf(strings[j]);
      fmt::print("{}\n", strings[j]);
    }
    free(strings);
  }

  const auto message =
    fmt::format("--- [PANIC] ---\n[FILE]: {}:{}\n[FUNCTION]: {}\n[REASON]: {}\nErrno: {}: {}\n--- [PANIC] ---",
      file,
      line,
      functionName,
      err_msg,
      savedErrno,
      strerror(savedErrno));
  logIf(message);
  fmt::print("{}\n", message);
  logging::Logger::GetLogger()->OnAbort();
  panic_exit();
}

void
panic(std::string_view err_msg, const std::source_location &loc, int strip_levels)
{
  panic(err_msg, loc.function_name(), loc.file_name(), static_cast<int>(loc.line()), strip_levels);
}
} // namespace dapc
