/** LICENSE TEMPLATE */
#pragma once

// dapsync
#include <common/macros.h>
#include <common/panic.h>
#include <common/typedefs.h>
#include <utils/util.h>

// std
#include <charconv>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <vector>

// fmt
#include <fmt/core.h>

using namespace std::string_view_literals;

namespace dapsync::cfg {

#define FOR_CLI_EACH_PARSE_ERROR(MAKE_ERR)                                                                        \
  MAKE_ERR(None, "Error not set.")                                                                                \
  MAKE_ERR(ArgNotFound, "Argument not found.")                                                                    \
  MAKE_ERR(MissingArgValue, "Command line option is missing it's value.")                                         \
  MAKE_ERR(InvalidFormat, "Invalid format of argument.")                                                          \
  MAKE_ERR(OutOfRange, "Value is out of range for this option.")                                                  \
  MAKE_ERR(UnrecognizedArgument, "Argument is not a recognized option.")                                          \
  MAKE_ERR(DirectoryDoesNotExist, "Directory does not exist")                                                     \
  MAKE_ERR(FileDoesNotExist, "File does not exist")

enum class ParseErrorType : u8
{
  FOR_CLI_EACH_PARSE_ERROR(DEFAULT_ENUM)
};

struct ParseOk
{
};

struct ParserError
{
  ParseErrorType mError;
  std::vector<std::string_view> mInputs;

  operator std::unexpected<ParserError>() && noexcept { return std::unexpected<ParserError>(std::move(*this)); }
};

template <typename T> using ParseResult = std::expected<T, ParserError>;

class ArgIterator
{
public:
  constexpr ArgIterator(int argc, const char **argv) : mArgCount(argc), mArgs(argv) {}

  bool
  HasNext() const noexcept
  {
    return mIndex < mArgCount;
  }

  // Called at the start of each parse pass in CommandLineRegistry::Parse, which may consume 0 or N arguments from
  // the argument vector. HasNext() must be checked before.
  std::string_view
  BeginNext() noexcept
  {
    RememberPosition();
    return *GetNext();
  }

  std::optional<std::string_view>
  GetNext() noexcept
  {
    if (mInsideInlineArgument) {
      std::string_view value = mArgs[mIndex];
      value.remove_prefix(mInsideInlineArgument.value());
      mInsideInlineArgument = {};
      ++mIndex;
      return value;
    }

    if (!HasNext()) {
      return std::nullopt;
    }
    std::string_view value = mArgs[mIndex];
    // Only options (--foo=bar) carry inline values. Positional arguments, like the adapter command after --, are
    // taken verbatim.
    auto inlineValuePos = value.find_first_of('=');
    if (value.starts_with('-') && inlineValuePos != value.npos) {
      mInsideInlineArgument = inlineValuePos + 1;
      return value.substr(0, inlineValuePos);
    } else {
      ++mIndex;
    }
    return value;
  }

  // Everything not yet consumed. Used for the arguments trailing `--`.
  std::span<const char *>
  Remaining() const noexcept
  {
    return Args().subspan(mIndex);
  }

  void
  ConsumeAll() noexcept
  {
    mInsideInlineArgument = {};
    mIndex = mArgCount;
  }

  std::span<const char *>
  Args() const noexcept
  {
    return std::span{ mArgs, mArgs + mArgCount };
  }

  std::unexpected<ParserError>
  Error(ParseErrorType type) noexcept
  {
    return std::unexpected(ParserError{ type, GetArgsCurrentlyBeingParsed() });
  }

private:
  std::vector<std::string_view>
  GetArgsCurrentlyBeingParsed()
  {
    // Always take the "current one" too, which may only have been partially parsed (due to inline values via
    // foo=bar)
    const auto end = mInsideInlineArgument ? mIndex + 1 : mIndex;
    std::vector<std::string_view> result;
    for (const char *arg : Args().subspan(mRememberedIndex, end - mRememberedIndex)) {
      result.emplace_back(arg);
    }
    return result;
  }

  void
  RememberPosition() noexcept
  {
    mRememberedIndex = mIndex;
  }

  int mArgCount;
  const char **mArgs;
  int mIndex{ 1 };
  std::optional<size_t> mInsideInlineArgument{};
  int mRememberedIndex{ 0 };
};

#ifndef TryExpected
#define TryExpected(iterator)                                                                                     \
  ({                                                                                                              \
    auto ___MAYBE_VALUE___ = iterator.GetNext();                                                                  \
    if (!___MAYBE_VALUE___) {                                                                                     \
      return iterator.Error(ParseErrorType::MissingArgValue);                                                     \
    }                                                                                                             \
    *___MAYBE_VALUE___;                                                                                           \
  })
#endif

struct OptionMetadata
{
  std::string mShortName;
  std::string mLongName;
  std::string_view mInfo;
  bool mIsFlag;
};

template <typename ParseInput> struct IOption : OptionMetadata
{
  using Input = ParseInput;
  virtual std::expected<ParseOk, ParserError> Parse(ParseInput it) noexcept = 0;
  virtual void ApplyDefault() noexcept = 0;
  virtual ~IOption() noexcept = default;
};

template <typename T, typename ParseInput> class DirectOption : public IOption<ParseInput>
{
  using Data = OptionMetadata;
  using IBase = IOption<ParseInput>;

public:
  using ParserFn = ParseResult<T> (*)(typename IBase::Input);

  DirectOption(std::string_view shortName,
    std::string_view longName,
    std::string_view helpMessage,
    T &reference,
    ParserFn parser,
    T defaultValue,
    bool isFlag)
      : mReference(&reference), mParseFn(parser), mDefault(std::move(defaultValue))
  {
    Data::mShortName = shortName;
    Data::mLongName = longName;
    Data::mInfo = helpMessage;
    Data::mIsFlag = isFlag;
  }

  std::expected<ParseOk, ParserError>
  Parse(ParseInput it) noexcept override
  {
    auto result = mParseFn(it);
    if (!result) {
      return std::unexpected(std::move(result.error()));
    }
    *mReference = std::move(result.value());
    return ParseOk{};
  }

  void
  ApplyDefault() noexcept override
  {
    *mReference = mDefault;
  }

private:
  T *mReference;
  ParserFn mParseFn;
  T mDefault;
};

struct CommandLineResult
{
  std::vector<ParserError> mErrors;
  // Arguments following a lone `--`, untouched.
  std::vector<std::string> mTrailingArguments;
};

class CommandLineRegistry
{
  static constexpr auto UNIFORM_LINE_INDENT = 2;
  std::unordered_map<std::string_view, std::shared_ptr<IOption<ArgIterator &>>> mOptions;
  std::unordered_map<std::string_view, std::shared_ptr<IOption<std::string_view>>> mEnvironmentVariables;
  // Registration order, so that help output is stable.
  std::vector<std::shared_ptr<IOption<ArgIterator &>>> mOptionsOrdered;
  std::vector<std::shared_ptr<IOption<std::string_view>>> mEnvironmentVariablesOrdered;
  // Holds the length of the largest left-column when displaying using PrintHelp
  // so the left column contains "-c, --com <value>" for an option that has both long and short form and is not a
  // flag. By calculating max width, we can format "properly", when we can't access a terminal size.
  size_t mLeftColumnDisplayWidth{ 0 };
  bool mParseCompleted{ false };

  void
  AssertUnique(std::string_view shortName, std::string_view longName) noexcept
  {
    VERIFY(!shortName.empty() || !longName.empty(), "You've not given this option a name!");
    if (!longName.empty()) {
      VERIFY(mOptions.count(longName) == 0, "Already added option {}", longName);
    }

    if (!shortName.empty()) {
      VERIFY(mOptions.count(shortName) == 0, "Already added option {}", shortName);
    }
  }

  void
  UpdateLeftColumnWidth(bool isFlag, std::string_view shortName, std::string_view longName) noexcept
  {
    const auto leftColumnWidth =
      shortName.size() + longName.size() + (isFlag ? 0 : kValuePlaceHolder.size()) + UNIFORM_LINE_INDENT + 2;

    mLeftColumnDisplayWidth = std::max(mLeftColumnDisplayWidth, leftColumnWidth);
  }

  void
  AddOption(std::string_view shortName,
    std::string_view longName,
    std::shared_ptr<IOption<ArgIterator &>> &&item) noexcept
  {
    VERIFY(!mParseCompleted, "You are adding options after parse has completed.");
    AssertUnique(shortName, longName);
    if (!shortName.empty()) {
      mOptions.emplace(item->mShortName, item);
    }

    if (!longName.empty()) {
      mOptions.emplace(item->mLongName, item);
    }
    mOptionsOrdered.push_back(std::move(item));
  }

public:
  static constexpr auto kValuePlaceHolder = " <value> "sv;

  const std::vector<std::shared_ptr<IOption<std::string_view>>> &
  GetEnvironmentVariableOptions() const noexcept
  {
    return mEnvironmentVariablesOrdered;
  }

  const std::vector<std::shared_ptr<IOption<ArgIterator &>>> &
  GetOptions() const noexcept
  {
    return mOptionsOrdered;
  }

  template <typename T, typename ConvertibleToT>
  void
  AddOption(std::string_view shortName,
    std::string_view longName,
    std::string_view message,
    T &variable,
    typename DirectOption<T, ArgIterator &>::ParserFn parser,
    ConvertibleToT defaultVal) noexcept
    requires(std::is_convertible_v<ConvertibleToT, T>)
  {
    UpdateLeftColumnWidth(false, shortName, longName);

    auto opt = std::make_shared<DirectOption<T, ArgIterator &>>(
      shortName, longName, message, variable, parser, T{ std::move(defaultVal) }, false);

    AddOption(shortName, longName, std::move(opt));
  }

  // Flags take no value. Their presence sets `variable` to true.
  void
  AddFlag(std::string_view shortName, std::string_view longName, std::string_view message, bool &variable) noexcept
  {
    UpdateLeftColumnWidth(true, shortName, longName);
    auto opt = std::make_shared<DirectOption<bool, ArgIterator &>>(
      shortName, longName, message, variable, [](ArgIterator &) -> ParseResult<bool> { return true; }, false, true);
    AddOption(shortName, longName, std::move(opt));
  }

  template <typename T, typename ConvertibleToT = T>
  void
  AddEnvironmentVariable(std::string_view name,
    std::string_view message,
    T &variable,
    typename DirectOption<T, std::string_view>::ParserFn parser,
    ConvertibleToT defaultVal = T{}) noexcept
    requires(std::is_convertible_v<ConvertibleToT, T>)
  {
    VERIFY(!mParseCompleted, "You are adding options after parse has completed.");
    VERIFY(mEnvironmentVariables.count(name) == 0, "Environment variable option already configured.");
    // Environment variable options have no short name.
    UpdateLeftColumnWidth(/* isFlag */ false, "", name);

    auto opt = std::make_shared<DirectOption<T, std::string_view>>(
      "", name, message, variable, parser, T{ std::move(defaultVal) }, false);
    mEnvironmentVariables.emplace(opt->mLongName, opt);
    mEnvironmentVariablesOrdered.push_back(std::move(opt));
  }

  CommandLineResult Parse(int argc, const char **argv) noexcept;
  void ParseEnvironmentVariableOptions() noexcept;

  void PrintHelp(std::string_view usage) const noexcept;
  void PrintHelpAbout(const OptionMetadata &option, u16 leftColumn, u16 rightColumn) const noexcept;
  std::pair<u16, u16> GetTerminalSize() const noexcept;
};

template <typename ResultType> struct FromTraits;

#define NumberTrait(NumberType)                                                                                   \
  template <> struct FromTraits<NumberType>                                                                       \
  {                                                                                                               \
    static ParseResult<NumberType>                                                                                \
    From(ArgIterator &it)                                                                                         \
    {                                                                                                             \
      auto arg = TryExpected(it);                                                                                 \
      if (auto number = ToIntegral<NumberType>(arg); number) {                                                    \
        return *number;                                                                                           \
      }                                                                                                           \
      return it.Error(ParseErrorType::InvalidFormat);                                                             \
    }                                                                                                             \
                                                                                                                  \
    static ParseResult<NumberType>                                                                                \
    From(std::string_view arg) noexcept                                                                           \
    {                                                                                                             \
      if (arg.empty())                                                                                            \
        return std::unexpected(ParserError{ ParseErrorType::MissingArgValue, {} });                               \
      if (auto number = ToIntegral<NumberType>(arg); number) {                                                    \
        return *number;                                                                                           \
      }                                                                                                           \
      return std::unexpected(ParserError{ ParseErrorType::InvalidFormat, { arg } });                              \
    }                                                                                                             \
  };

#define FOR_EACH_PRIMITIVE(PRIM)                                                                                  \
  PRIM(i32)                                                                                                       \
  PRIM(i64)                                                                                                       \
  PRIM(u16)                                                                                                       \
  PRIM(u32)                                                                                                       \
  PRIM(u64)

#define AsIsTrait(Type)                                                                                           \
  template <> struct FromTraits<Type>                                                                             \
  {                                                                                                               \
    static ParseResult<Type>                                                                                      \
    From(ArgIterator &it)                                                                                         \
    {                                                                                                             \
      auto arg = TryExpected(it);                                                                                 \
      return Type{ arg };                                                                                         \
    }                                                                                                             \
                                                                                                                  \
    static ParseResult<Type>                                                                                      \
    From(std::string_view arg) noexcept                                                                           \
    {                                                                                                             \
      return Type{ arg };                                                                                         \
    }                                                                                                             \
  };

#define FOR_EACH_AS_IS(AS_IS)                                                                                     \
  AS_IS(std::string)                                                                                              \
  AS_IS(std::filesystem::path)

FOR_EACH_AS_IS(AsIsTrait)

FOR_EACH_PRIMITIVE(NumberTrait)

} // namespace dapsync::cfg

template <> struct fmt::formatter<dapsync::cfg::ParseErrorType> : public Default<dapsync::cfg::ParseErrorType>
{
  template <typename FormatContext>
  auto
  format(const dapsync::cfg::ParseErrorType &option, FormatContext &context) const
  {
#define PARSE_ERROR_MSG(EnumValue, Message, ...)                                                                  \
  case dapsync::cfg::ParseErrorType::EnumValue:                                                                   \
    return fmt::format_to(context.out(), Message);

    switch (option) {
      FOR_CLI_EACH_PARSE_ERROR(PARSE_ERROR_MSG)
    }
#undef PARSE_ERROR_MSG
    DSYNC_UNREACHABLE
  }
};

template <> struct fmt::formatter<dapsync::cfg::ParserError> : public Default<dapsync::cfg::ParserError>
{
  template <typename FormatContext>
  auto
  format(const dapsync::cfg::ParserError &error, FormatContext &ctx) const
  {
    auto it = fmt::format_to(ctx.out(), "Parse error: {}", error.mError);
    for (const auto &input : error.mInputs) {
      it = fmt::format_to(it, " {}", input);
    }
    return it;
  }
};

#undef FOR_CLI_EACH_PARSE_ERROR
