#pragma once

#include <chrono>                    // std::chrono::system_clock
#include <cstdio>                    // stderr
#include <ctime>                     // localtime_r, strftime, time_t, tm
#include <exception>                 // std::exception
#include <filesystem>                // std::filesystem::path
#include <format>                    // std::format
#include <ftxui/screen/color.hpp>    // ftxui::Color
#include <magic_enum/magic_enum.hpp> // magic_enum::{enum_cast, enum_values}
#include <print>                     // std::print, std::println
#include <utility>                   // std::forward

#ifndef NDEBUG
  #include <source_location> // std::source_location
#endif

#include "Error.hpp"
#include "Types.hpp"

namespace climatime::utils::logging {
  namespace {
    using types::Array;
    using types::LockGuard;
    using types::Mutex;
    using types::Option;
    using types::PCStr;
    using types::String;
    using types::StringView;
    using types::u8;
    using types::usize;
  } // namespace

  inline fn GetLogMutex() -> Mutex& {
    static Mutex LogMutexInstance;
    return LogMutexInstance;
  }

  struct LogLevelConst {
    // clang-format off
    static constexpr Array<StringView, 16> COLOR_CODE_LITERALS = {
      "\033[38;5;0m",  "\033[38;5;1m",  "\033[38;5;2m",  "\033[38;5;3m",
      "\033[38;5;4m",  "\033[38;5;5m",  "\033[38;5;6m",  "\033[38;5;7m",
      "\033[38;5;8m",  "\033[38;5;9m",  "\033[38;5;10m", "\033[38;5;11m",
      "\033[38;5;12m", "\033[38;5;13m", "\033[38;5;14m", "\033[38;5;15m",
    };
    // clang-format on

    static constexpr PCStr RESET_CODE   = "\033[0m";
    static constexpr PCStr BOLD_START   = "\033[1m";
    static constexpr PCStr BOLD_END     = "\033[22m";
    static constexpr PCStr ITALIC_START = "\033[3m";
    static constexpr PCStr ITALIC_END   = "\033[23m";

    static constexpr StringView DEBUG_STR = "DEBUG";
    static constexpr StringView INFO_STR  = "INFO ";
    static constexpr StringView WARN_STR  = "WARN ";
    static constexpr StringView ERROR_STR = "ERROR";

    static constexpr ftxui::Color::Palette16 DEBUG_COLOR      = ftxui::Color::Palette16::Cyan;
    static constexpr ftxui::Color::Palette16 INFO_COLOR       = ftxui::Color::Palette16::Green;
    static constexpr ftxui::Color::Palette16 WARN_COLOR       = ftxui::Color::Palette16::Yellow;
    static constexpr ftxui::Color::Palette16 ERROR_COLOR      = ftxui::Color::Palette16::Red;
    static constexpr ftxui::Color::Palette16 DEBUG_INFO_COLOR = ftxui::Color::Palette16::GrayLight;

    static constexpr PCStr TIMESTAMP_FORMAT = "%X";
    static constexpr PCStr LOG_FORMAT       = "{} {} {}";

#ifndef NDEBUG
    static constexpr PCStr FILE_LINE_FORMAT  = "{}:{}";
    static constexpr PCStr DEBUG_LINE_PREFIX = "           ╰──── ";
#endif
  };

  /**
   * @enum LogLevel
   * @brief Represents different log levels.
   */
  enum class LogLevel : u8 {
    Debug,
    Info,
    Warn,
    Error,
  };

  inline fn GetRuntimeLogLevel() -> LogLevel& {
    static LogLevel RuntimeLogLevel = LogLevel::Info;
    return RuntimeLogLevel;
  }

  inline fn SetRuntimeLogLevel(const LogLevel level) {
    GetRuntimeLogLevel() = level;
  }

  /**
   * @brief Parses a log level name, ignoring case ("debug", "WARN", ...).
   * @param name The level name.
   * @return The matching level, or None for an unknown name.
   */
  inline fn ParseLogLevel(const StringView name) -> Option<LogLevel> {
    return magic_enum::enum_cast<LogLevel>(name, magic_enum::case_insensitive);
  }

  /**
   * @brief Directly applies ANSI color codes to text
   * @param text The text to colorize
   * @param color The FTXUI color
   * @return Styled string with ANSI codes
   */
  inline fn Colorize(const StringView text, const ftxui::Color::Palette16& color) -> String {
    return std::format("{}{}{}", LogLevelConst::COLOR_CODE_LITERALS.at(static_cast<usize>(color)), text, LogLevelConst::RESET_CODE);
  }

  /**
   * @brief Make text bold with ANSI codes
   * @param text The text to make bold
   * @return Bold text
   */
  inline fn Bold(const StringView text) -> String {
    return std::format("{}{}{}", LogLevelConst::BOLD_START, text, LogLevelConst::BOLD_END);
  }

  /**
   * @brief Make text italic with ANSI codes
   * @param text The text to make italic
   * @return Italic text
   */
  inline fn Italic(const StringView text) -> String {
    return std::format("{}{}{}", LogLevelConst::ITALIC_START, text, LogLevelConst::ITALIC_END);
  }

  /**
   * @brief Returns FTXUI color representation for a log level
   * @param level The log level
   * @return FTXUI color code
   */
  constexpr fn GetLevelColor(const LogLevel level) -> ftxui::Color::Palette16 {
    using namespace matchit;
    using enum LogLevel;

    return match(level)(
      is | Debug = LogLevelConst::DEBUG_COLOR,
      is | Info  = LogLevelConst::INFO_COLOR,
      is | Warn  = LogLevelConst::WARN_COLOR,
      is | Error = LogLevelConst::ERROR_COLOR
    );
  }

  /**
   * @brief Returns string representation of a log level
   * @param level The log level
   * @return String representation
   */
  constexpr fn GetLevelString(const LogLevel level) -> StringView {
    using namespace matchit;
    using enum LogLevel;

    return match(level)(
      is | Debug = LogLevelConst::DEBUG_STR,
      is | Info  = LogLevelConst::INFO_STR,
      is | Warn  = LogLevelConst::WARN_STR,
      is | Error = LogLevelConst::ERROR_STR
    );
  }

  // Bold, colored level labels indexed by LogLevel.
  inline fn GetLevelLabels() -> const Array<String, 4>& {
    static const Array<String, 4> LABELS = [] {
      Array<String, 4> labels;

      for (const LogLevel level : magic_enum::enum_values<LogLevel>())
        labels.at(static_cast<usize>(level)) = Bold(Colorize(GetLevelString(level), GetLevelColor(level)));

      return labels;
    }();

    return LABELS;
  }

  /**
   * @brief Prints formatted text with a trailing newline to stdout.
   * @tparam Args Parameter pack for format arguments
   * @param fmt The format string
   * @param args The arguments for the format string
   */
  template <typename... Args>
  inline fn Println(std::format_string<Args...> fmt, Args&&... args) {
    std::println(fmt, std::forward<Args>(args)...);
  }

  /**
   * @brief Prints pre-formatted text with a trailing newline to stdout.
   * @param text The pre-formatted text to print
   */
  inline fn Println(const StringView text) {
    std::println("{}", text);
  }

  // Diagnostics go to stderr so document output on stdout stays parseable.
  inline fn PrintDiagnostic(const StringView text) {
    std::print(stderr, "{}", text);
  }

  /**
   * @brief Logs a message with the specified log level, source location, and format string.
   * @tparam Args Parameter pack for format arguments.
   * @param level The log level (DEBUG, INFO, WARN, ERROR).
   * @param loc The source location of the log message (only in Debug builds).
   * @param fmt The format string.
   * @param args The arguments for the format string.
   */
  template <typename... Args>
  fn LogImpl(
    const LogLevel level,
#ifndef NDEBUG
    const std::source_location& loc,
#endif
    std::format_string<Args...> fmt,
    Args&&... args
  ) {
    using namespace std::chrono;
    using std::filesystem::path;

    if (level < GetRuntimeLogLevel())
      return;

    const auto        nowTp = system_clock::now();
    const std::time_t nowTt = system_clock::to_time_t(nowTp);
    std::tm           localTm {};

    String timestamp = "??:??:??";

    if (localtime_r(&nowTt, &localTm) != nullptr) {
      Array<char, 64> timeBuffer {};

      if (std::strftime(timeBuffer.data(), timeBuffer.size(), LogLevelConst::TIMESTAMP_FORMAT, &localTm) > 0)
        timestamp = timeBuffer.data();
    }

    const String message = std::format(fmt, std::forward<Args>(args)...);

    String line = std::format(
      LogLevelConst::LOG_FORMAT,
      Colorize(std::format("[{}]", timestamp), LogLevelConst::DEBUG_INFO_COLOR),
      GetLevelLabels().at(static_cast<usize>(level)),
      message
    );

#ifndef NDEBUG
    const String fileLine = std::format(LogLevelConst::FILE_LINE_FORMAT, path(loc.file_name()).lexically_normal().string(), loc.line());

    line += std::format("\n{}{}", Italic(Colorize(std::format("{}{}", LogLevelConst::DEBUG_LINE_PREFIX, fileLine), LogLevelConst::DEBUG_INFO_COLOR)), LogLevelConst::RESET_CODE);
#else
    line += LogLevelConst::RESET_CODE;
#endif

    line += '\n';

    // Worker threads log concurrently; one write per line under the lock.
    const LockGuard lock(GetLogMutex());
    PrintDiagnostic(line);
  }

  inline fn LogError(const LogLevel level, const error::ClimaError& err) {
#ifndef NDEBUG
    LogImpl(level, err.location, "{} ({})", err.message, err.code);
#else
    LogImpl(level, "{} ({})", err.message, err.code);
#endif
  }

  inline fn LogError(
    const LogLevel        level,
    const std::exception& err
#ifndef NDEBUG
    ,
    const std::source_location& loc = std::source_location::current()
#endif
  ) {
#ifndef NDEBUG
    LogImpl(level, loc, "{}", err.what());
#else
    LogImpl(level, "{}", err.what());
#endif
  }

#define warn_at(error_obj)  ::climatime::utils::logging::LogError(::climatime::utils::logging::LogLevel::Warn, error_obj)
#define error_at(error_obj) ::climatime::utils::logging::LogError(::climatime::utils::logging::LogLevel::Error, error_obj)

#ifdef NDEBUG
  #define debug_log(fmt, ...) ::climatime::utils::logging::LogImpl(::climatime::utils::logging::LogLevel::Debug, fmt __VA_OPT__(, ) __VA_ARGS__)
  #define info_log(fmt, ...)  ::climatime::utils::logging::LogImpl(::climatime::utils::logging::LogLevel::Info, fmt __VA_OPT__(, ) __VA_ARGS__)
  #define warn_log(fmt, ...)  ::climatime::utils::logging::LogImpl(::climatime::utils::logging::LogLevel::Warn, fmt __VA_OPT__(, ) __VA_ARGS__)
  #define error_log(fmt, ...) ::climatime::utils::logging::LogImpl(::climatime::utils::logging::LogLevel::Error, fmt __VA_OPT__(, ) __VA_ARGS__)
#else
  #define debug_log(fmt, ...) \
    ::climatime::utils::logging::LogImpl(::climatime::utils::logging::LogLevel::Debug, std::source_location::current(), fmt __VA_OPT__(, ) __VA_ARGS__)
  #define info_log(fmt, ...) \
    ::climatime::utils::logging::LogImpl(::climatime::utils::logging::LogLevel::Info, std::source_location::current(), fmt __VA_OPT__(, ) __VA_ARGS__)
  #define warn_log(fmt, ...) \
    ::climatime::utils::logging::LogImpl(::climatime::utils::logging::LogLevel::Warn, std::source_location::current(), fmt __VA_OPT__(, ) __VA_ARGS__)
  #define error_log(fmt, ...) \
    ::climatime::utils::logging::LogImpl(::climatime::utils::logging::LogLevel::Error, std::source_location::current(), fmt __VA_OPT__(, ) __VA_ARGS__)
#endif
} // namespace climatime::utils::logging
