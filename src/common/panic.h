/** LICENSE TEMPLATE */
#pragma once

// stdlib
#include <source_location>
#include <string_view>

// fmt
#include <fmt/core.h>

namespace dapsync {
[[noreturn]] void panic(std::string_view err_msg, const char *functionName, const char *file, int line,
                        int strip_levels);

[[noreturn]] void panic(std::string_view err_msg, const std::source_location &loc, int strip_levels);
} // namespace dapsync

// defines PANIC macro. Responsibility on caller to include required headers.

#define PANIC(err_msg)                                                                                            \
  {                                                                                                               \
    auto loc = std::source_location::current();                                                                   \
    ::dapsync::panic(err_msg, loc, 1);                                                                            \
  }

// clang-format off
#define VERIFY(cond, msg, ...) if (!(cond)) [[unlikely]] { std::source_location loc = std::source_location::current(); \
    ::dapsync::panic(fmt::format("{} FAILED {}", #cond, fmt::format(msg __VA_OPT__(, ) __VA_ARGS__)), loc, 1);    \
  }
// clang-format on
