#include <Climatime/Utils/Logging.hpp>
#include <Climatime/Utils/Types.hpp>

#include "gtest/gtest.h"

using namespace testing;
using climatime::utils::logging::Bold;
using climatime::utils::logging::Colorize;
using climatime::utils::logging::GetLevelColor;
using climatime::utils::logging::GetLevelLabels;
using climatime::utils::logging::GetLevelString;
using climatime::utils::logging::GetRuntimeLogLevel;
using climatime::utils::logging::Italic;
using climatime::utils::logging::LogLevel;
using climatime::utils::logging::LogLevelConst;
using climatime::utils::logging::ParseLogLevel;
using climatime::utils::logging::SetRuntimeLogLevel;
using climatime::utils::types::i32;
using climatime::utils::types::String;
using climatime::utils::types::StringView;
using climatime::utils::types::usize;

using Palette = ftxui::Color::Palette16;

class LoggingUtilsTest : public Test {
 protected:
  fn TearDown() -> void override {
    SetRuntimeLogLevel(LogLevel::Info);
  }
};

TEST_F(LoggingUtilsTest, Colorize_WrapsTextInPaletteCode) {
  constexpr StringView textToColorize = "Record heat";
  constexpr Palette    color          = Palette::Red;
  const String         expectedPrefix = String(LogLevelConst::COLOR_CODE_LITERALS.at(static_cast<usize>(color)));
  const String         expectedSuffix = String(LogLevelConst::RESET_CODE);

  const String colorizedText = Colorize(textToColorize, color);

  EXPECT_EQ(colorizedText.rfind(expectedPrefix, 0), 0U);
  EXPECT_NE(colorizedText.find(textToColorize), String::npos);
  EXPECT_EQ(colorizedText.substr(colorizedText.length() - expectedSuffix.length()), expectedSuffix);
}

TEST_F(LoggingUtilsTest, Colorize_EmptyText) {
  constexpr StringView textToColorize;
  constexpr Palette    color = Palette::Green;

  const String expectedText = String(LogLevelConst::COLOR_CODE_LITERALS.at(static_cast<usize>(color))) + String(LogLevelConst::RESET_CODE);

  EXPECT_EQ(Colorize(textToColorize, color), expectedText);
}

TEST_F(LoggingUtilsTest, Bold_SimpleText) {
  constexpr StringView textToBold = "Warming trend";

  EXPECT_EQ(Bold(textToBold), String(LogLevelConst::BOLD_START) + String(textToBold) + String(LogLevelConst::BOLD_END));
}

TEST_F(LoggingUtilsTest, Italic_SimpleText) {
  constexpr StringView textToItalicize = "moderate scenario";

  EXPECT_EQ(Italic(textToItalicize), String(LogLevelConst::ITALIC_START) + String(textToItalicize) + String(LogLevelConst::ITALIC_END));
}

TEST_F(LoggingUtilsTest, Combined_BoldItalicColoredText) {
  constexpr StringView textToStyle = "Styled Text";
  constexpr Palette    color       = Palette::Magenta;

  String expected = String(LogLevelConst::ITALIC_START) + String(textToStyle) + String(LogLevelConst::ITALIC_END);
  expected        = String(LogLevelConst::BOLD_START) + expected + String(LogLevelConst::BOLD_END);
  expected        = String(LogLevelConst::COLOR_CODE_LITERALS.at(static_cast<usize>(color))) + expected + String(LogLevelConst::RESET_CODE);

  EXPECT_EQ(Colorize(Bold(Italic(textToStyle)), color), expected);
}

TEST_F(LoggingUtilsTest, ParseLogLevel_IgnoresCase) {
  EXPECT_EQ(ParseLogLevel("debug"), LogLevel::Debug);
  EXPECT_EQ(ParseLogLevel("INFO"), LogLevel::Info);
  EXPECT_EQ(ParseLogLevel("Warn"), LogLevel::Warn);
  EXPECT_EQ(ParseLogLevel("error"), LogLevel::Error);
}

TEST_F(LoggingUtilsTest, ParseLogLevel_RejectsUnknownNames) {
  EXPECT_FALSE(ParseLogLevel("verbose").has_value());
  EXPECT_FALSE(ParseLogLevel("").has_value());
}

TEST_F(LoggingUtilsTest, LevelStringsAndColors) {
  EXPECT_EQ(GetLevelString(LogLevel::Debug), LogLevelConst::DEBUG_STR);
  EXPECT_EQ(GetLevelString(LogLevel::Error), LogLevelConst::ERROR_STR);
  EXPECT_EQ(GetLevelColor(LogLevel::Warn), LogLevelConst::WARN_COLOR);
  EXPECT_EQ(GetLevelColor(LogLevel::Info), LogLevelConst::INFO_COLOR);
}

TEST_F(LoggingUtilsTest, LevelLabels_AreBoldAndColoredPerLevel) {
  EXPECT_EQ(GetLevelLabels().at(static_cast<usize>(LogLevel::Warn)), Bold(Colorize(LogLevelConst::WARN_STR, Palette::Yellow)));
  EXPECT_EQ(GetLevelLabels().at(static_cast<usize>(LogLevel::Error)), Bold(Colorize(LogLevelConst::ERROR_STR, Palette::Red)));
}

TEST_F(LoggingUtilsTest, RuntimeLevel_CanBeChanged) {
  SetRuntimeLogLevel(LogLevel::Error);
  EXPECT_EQ(GetRuntimeLogLevel(), LogLevel::Error);
}

fn main(i32 argc, char** argv) -> i32 {
  InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
