/** LICENSE TEMPLATE */
#include "command_line.h"

// dapsync
#include <utils/logger.h>

// std
#include <cstdlib>

// system
#include <sys/ioctl.h>
#include <unistd.h>

namespace dapsync::cfg {
CommandLineResult
CommandLineRegistry::Parse(int argc, const char **argv) noexcept
{
  CommandLineResult result{};

  for (auto &opt : GetOptions()) {
    opt->ApplyDefault();
  }
  ArgIterator it(argc, argv);
  while (it.HasNext()) {
    auto current = it.BeginNext();

    if (current == "--") {
      for (const char *arg : it.Remaining()) {
        result.mTrailingArguments.emplace_back(arg);
      }
      it.ConsumeAll();
      break;
    }

    if (auto optionIter = mOptions.find(current); optionIter != std::end(mOptions)) {
      auto res = optionIter->second->Parse(it);
      if (!res) {
        result.mErrors.push_back(std::move(res.error()));
      }
    } else {
      result.mErrors.push_back(it.Error(ParseErrorType::UnrecognizedArgument).error());
    }
  }

  // Environment variables fail silently, because they're not intended to be "hard options".
  ParseEnvironmentVariableOptions();
  mParseCompleted = true;
  return result;
}

void
CommandLineRegistry::ParseEnvironmentVariableOptions() noexcept
{
  for (auto &opt : GetEnvironmentVariableOptions()) {
    opt->ApplyDefault();
  }

  for (const auto &[k, v] : mEnvironmentVariables) {
    if (auto value = std::getenv(v->mLongName.c_str()); value) {
      if (auto res = v->Parse(std::string_view{ value }); !res) {
        DBGLOG(warning, "ignoring environment variable {}: {}", k, res.error());
      }
    }
  }
}

std::pair<u16, u16>
CommandLineRegistry::GetTerminalSize() const noexcept
{
  struct winsize terminalSize;

  if (isatty(STDOUT_FILENO) && ioctl(STDOUT_FILENO, TIOCGWINSZ, &terminalSize) == 0 && terminalSize.ws_col > 0) {
    auto leftColumnWidth = static_cast<u16>(terminalSize.ws_col * 0.25);
    if (leftColumnWidth <= mLeftColumnDisplayWidth) {
      leftColumnWidth = static_cast<u16>(mLeftColumnDisplayWidth + 1);
    } else {
      // Don't waste space, give the left column at most 4 characters of trailing white space after it.
      leftColumnWidth = std::min<u16>(leftColumnWidth, static_cast<u16>(mLeftColumnDisplayWidth + 4));
    }
    const auto rightColumnWidth = std::max<int>(terminalSize.ws_col - leftColumnWidth, 20);

    return std::pair<u16, u16>{ leftColumnWidth, static_cast<u16>(rightColumnWidth) };
  }
  return std::pair<u16, u16>{ static_cast<u16>(mLeftColumnDisplayWidth + 1), 80 };
}

static std::vector<std::string_view>
CreateLinesOfWidth(std::string_view text, u16 width) noexcept
{
  std::vector<std::string_view> lines;
  while (!text.empty()) {
    if (const auto newline = text.find('\n'); newline != text.npos && newline <= width) {
      lines.push_back(text.substr(0, newline));
      text.remove_prefix(newline + 1);
      continue;
    }
    if (text.size() <= width) {
      lines.push_back(text);
      break;
    }
    auto split = text.substr(0, width).find_last_of(' ');
    if (split == text.npos || split == 0) {
      split = width;
    }
    lines.push_back(text.substr(0, split));
    text.remove_prefix(split);
    while (!text.empty() && text.front() == ' ') {
      text.remove_prefix(1);
    }
  }
  return lines;
}

void
CommandLineRegistry::PrintHelpAbout(const OptionMetadata &option, u16 leftColumn, u16 rightColumn) const noexcept
{
  std::string left{ "  " };
  if (!option.mShortName.empty()) {
    left.append(option.mShortName);
    if (!option.mLongName.empty()) {
      left.append(", ");
    }
  }
  left.append(option.mLongName);
  if (!option.mIsFlag) {
    left.append(kValuePlaceHolder);
  }

  const auto lines = CreateLinesOfWidth(option.mInfo, rightColumn);
  const auto padding = left.size() < leftColumn ? leftColumn - left.size() : 1;
  fmt::print("{}{:<{}}{}\n", left, "", padding, lines.empty() ? std::string_view{} : lines.front());
  for (const auto &line : std::span{ lines }.subspan(lines.empty() ? 0 : 1)) {
    fmt::print("{:<{}}{}\n", "", leftColumn, line);
  }
}

void
CommandLineRegistry::PrintHelp(std::string_view usage) const noexcept
{
  fmt::print("Usage:\n\n  {}\n\nOptions:\n\n", usage);

  auto [leftColumn, rightColumn] = GetTerminalSize();

  for (const auto &option : GetOptions()) {
    PrintHelpAbout(*option, leftColumn, rightColumn);
  }

  fmt::print("\nEnvironment variables:\n\n");
  for (const auto &envVar : GetEnvironmentVariableOptions()) {
    PrintHelpAbout(*envVar, leftColumn, rightColumn);
  }
}

} // namespace dapsync::cfg
