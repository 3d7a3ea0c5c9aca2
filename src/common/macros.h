/** LICENSE TEMPLATE */
#pragma once
// dapsync
#include <common/typedefs.h>

// stdlib
#include <array>
#include <optional>
#include <span>
#include <string_view>
#include <utility>

// fmt
#include <fmt/core.h>

#if defined(__clang__)
#define DSYNC_UNREACHABLE std::unreachable();
#elif defined(__GNUC__) || defined(__GNUG__)
#define DSYNC_UNREACHABLE __builtin_unreachable();
#endif

#ifndef NO_COPY
/// Types that use NO_COPY in this codebase tend to be created and used via pointers, both raw and smart alike.
#define NO_COPY(CLASS)                                                                                            \
  CLASS(const CLASS &) = delete;                                                                                  \
  CLASS(CLASS &) = delete;                                                                                        \
  CLASS &operator=(CLASS &) = delete;                                                                             \
  CLASS &operator=(const CLASS &) = delete;
#endif

#ifndef MOVE_ONLY
#define MOVE_ONLY(CLASS)                                                                                          \
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

#define DEFAULT_ENUM(Value, ...) Value,

#define STRINGIFY_VAL(x, ...) #x,

#define CAST_FN(Value, ...)                                                                                       \
  case static_cast<i32>(Value):                                                                                   \
    return Value;

template <typename T> struct Enum
{
  static constexpr u32 Count() noexcept;
  static constexpr std::optional<T> FromInt(int value) noexcept;
};

template <typename T> struct Default
{
  template <typename ParseContext>
  constexpr auto
  parse(ParseContext &context)
  {
    return context.begin();
  }
};

#define ENUM_FMT(ENUM_TYPE, FOR_EACH_FN, CASE_FN)                                                                 \
  template <> struct fmt::formatter<ENUM_TYPE> : public Default<ENUM_TYPE>                                        \
  {                                                                                                               \
    template <typename FormatContext>                                                                             \
    auto                                                                                                          \
    format(const ENUM_TYPE &value, FormatContext &ctx) const                                                      \
    {                                                                                                             \
      return fmt::format_to(ctx.out(), "{}", Enum<ENUM_TYPE>::ToString(value));                                   \
    }                                                                                                             \
  }

// Declares `enum class ENUM_TYPE` from an X-macro list and generates the `Enum<ENUM_TYPE>` reflection helpers
// (count, iteration, to/from string) together with a fmt formatter. Must be used at global scope.
#define ENUM_TYPE_METADATA(ENUM_TYPE, FOR_EACH, EACH_FN, UNDERLYING_TYPE)                                         \
  enum class ENUM_TYPE : UNDERLYING_TYPE                                                                          \
  {                                                                                                               \
    FOR_EACH(EACH_FN)                                                                                             \
  };                                                                                                              \
  namespace detail {                                                                                              \
  using enum ENUM_TYPE;                                                                                           \
  static constexpr auto ENUM_TYPE##Ids = std::to_array<ENUM_TYPE>({ FOR_EACH(DEFAULT_ENUM) });                    \
  static constexpr auto ENUM_TYPE##Names = std::to_array<std::string_view>({ FOR_EACH(STRINGIFY_VAL) });          \
  }                                                                                                               \
  template <> struct Enum<ENUM_TYPE>                                                                              \
  {                                                                                                               \
    static constexpr u32                                                                                          \
    Count() noexcept                                                                                              \
    {                                                                                                             \
      return detail::ENUM_TYPE##Ids.size();                                                                       \
    }                                                                                                             \
                                                                                                                  \
    static constexpr std::optional<ENUM_TYPE>                                                                     \
    FromInt(int value) noexcept                                                                                   \
    {                                                                                                             \
      using enum ENUM_TYPE;                                                                                       \
      switch (value) {                                                                                            \
        FOR_EACH(CAST_FN)                                                                                         \
      default:                                                                                                    \
        return std::nullopt;                                                                                      \
      }                                                                                                           \
      DSYNC_UNREACHABLE                                                                                           \
    }                                                                                                             \
                                                                                                                  \
    static constexpr std::span<const ENUM_TYPE>                                                                   \
    Variants() noexcept                                                                                           \
    {                                                                                                             \
      return std::span{ detail::ENUM_TYPE##Ids };                                                                 \
    }                                                                                                             \
                                                                                                                  \
    static constexpr std::string_view                                                                             \
    ToString(ENUM_TYPE value) noexcept                                                                            \
    {                                                                                                             \
      return detail::ENUM_TYPE##Names[std::to_underlying(value)];                                                 \
    }                                                                                                             \
                                                                                                                  \
    static constexpr std::optional<ENUM_TYPE>                                                                     \
    FromString(std::string_view str) noexcept                                                                     \
    {                                                                                                             \
      auto index = 0u;                                                                                            \
      for (const auto &n : detail::ENUM_TYPE##Names) {                                                            \
        if (n == str) {                                                                                           \
          return detail::ENUM_TYPE##Ids[index];                                                                   \
        }                                                                                                         \
        ++index;                                                                                                  \
      }                                                                                                           \
      return std::nullopt;                                                                                        \
    }                                                                                                             \
  };                                                                                                              \
  ENUM_FMT(ENUM_TYPE, FOR_EACH, EACH_FN);
