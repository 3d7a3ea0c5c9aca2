/** LICENSE TEMPLATE */
#include "panic.h"

// dapsync
#include <utils/logger.h>

// stdlib
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <regex>
#include <string>

// system
#include <cxxabi.h>
#include <execinfo.h>

namespace dapsync {
template <typename T>
void
replace_regex(T &str)
{
  static const std::regex str_view_regex("std::basic_string_view<char, std::char_traits<char> >");
  static const std::regex str_regex{
    "std::__cxx11::basic_string<char, std::char_traits<char>, std::allocator<char> >"
  };

  str = std::regex_replace(str, str_view_regex, "std::string_view");
  str = std::regex_replace(str, str_regex, "std::string");
}

static void
PrintAndLog(std::string_view message) noexcept
{
  logging::Logger::GetLogger()->Log(Channel::core, message);
  fmt::print(stderr, "{}\n", message);
}

[[noreturn]] void
panic(std::string_view err_msg, const char *functionName, const char *file, int line, int strip_levels)
{
  // Read errno before anything below gets a chance to clobber it.
  const auto savedErrno = errno;
  constexpr auto BT_BUF_SIZE = 100;
  void *buffer[BT_BUF_SIZE];
  const int nptrs = backtrace(buffer, BT_BUF_SIZE);
  PrintAndLog(fmt::format("backtrace() returned {} addresses", nptrs));

  if (char **strings = backtrace_symbols(buffer, nptrs); strings != nullptr) {
    for (int j = strip_levels; j < nptrs; j++) {
      std::string_view view{ strings[j] };
      if (const auto p = view.find("_Z"); p != std::string_view::npos) {
        view.remove_prefix(p);
        if (const auto plus = view.find('+'); plus != std::string_view::npos) {
          view.remove_suffix(view.size() - plus);
        }
        std::string mangled{ view };
        int stat = 0;
        if (char *res = abi::__cxa_demangle(mangled.c_str(), nullptr, nullptr, &stat); stat == 0 && res) {
          std::string demangled{ res };
          std::free(res);
          replace_regex(demangled);
          PrintAndLog(demangled);
          continue;
        }
      }
      PrintAndLog(strings[j]);
    }
    std::free(strings);
  } else {
    perror("backtrace_symbols");
  }

  PrintAndLog(
    fmt::format("--- [PANIC] ---\n[FILE]: {}:{}\n[FUNCTION]: {}\n[REASON]: {}\nErrno: {}: {}\n--- [PANIC] ---",
      file,
      line,
      functionName,
      err_msg,
      savedErrno,
      strerror(savedErrno)));
  logging::Logger::GetLogger()->OnAbort();
  std::abort();
}

[[noreturn]] void
panic(std::string_view err_msg, const std::source_location &loc, int strip_levels)
{
  panic(err_msg, loc.function_name(), loc.file_name(), static_cast<int>(loc.line()), strip_levels);
}
} // namespace dapsync
