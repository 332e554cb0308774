/**
 * @file debug_test.cpp
 * @brief Tests for diagnostic tracing.
 */

#include "typeguesser/debug.h"
#include "typeguesser/guesser.h"

#include <cstdio>
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace typeguesser;

class DebugTest : public ::testing::Test {
protected:
  void SetUp() override { output_file_ = tmpfile(); }

  void TearDown() override {
    if (output_file_) {
      fclose(output_file_);
    }
  }

  std::string get_output() {
    if (!output_file_)
      return "";
    fflush(output_file_);
    rewind(output_file_);
    std::string result;
    char buffer[1024];
    while (fgets(buffer, sizeof(buffer), output_file_)) {
      result += buffer;
    }
    return result;
  }

  GuessSettings verbose_settings() {
    GuessSettings settings;
    settings.debug = DebugConfig::all();
    settings.debug.output = output_file_;
    return settings;
  }

  FILE* output_file_ = nullptr;
};

TEST_F(DebugTest, DefaultConfigIsSilent) {
  DebugConfig config;
  EXPECT_FALSE(config.enabled());
  EXPECT_EQ(config.output, nullptr);
}

TEST_F(DebugTest, AllEnablesVerbose) {
  DebugConfig config = DebugConfig::all();
  EXPECT_TRUE(config.enabled());
  EXPECT_TRUE(config.verbose);
}

TEST_F(DebugTest, LogWritesPrefixedLine) {
  ASSERT_NE(output_file_, nullptr);
  DebugConfig config = DebugConfig::all();
  config.output = output_file_;
  DebugTrace trace(config);
  trace.log("value %d", 42);
  EXPECT_EQ(get_output(), "[typeguesser] value 42\n");
}

TEST_F(DebugTest, DisabledTraceWritesNothing) {
  ASSERT_NE(output_file_, nullptr);
  DebugConfig config;
  config.output = output_file_;
  DebugTrace trace(config);
  trace.log("hidden");
  trace.log_str("hidden");
  trace.log_decision("INTEGER", "hidden");
  trace.log_transition("INTEGER", "DECIMAL", "hidden");
  trace.log_size("INTEGER", 1, 0, 1);
  EXPECT_TRUE(get_output().empty());
}

TEST_F(DebugTest, LogStrDoesNotInterpretFormat) {
  ASSERT_NE(output_file_, nullptr);
  DebugConfig config = DebugConfig::all();
  config.output = output_file_;
  DebugTrace trace(config);
  trace.log_str("100%s done");
  EXPECT_EQ(get_output(), "[typeguesser] 100%s done\n");
}

TEST_F(DebugTest, GuesserReportsTypeLock) {
  ASSERT_NE(output_file_, nullptr);
  Guesser guesser(verbose_settings());
  guesser.adjust_to_compensate_for_value("12");
  std::string output = get_output();
  EXPECT_NE(output.find("DECISION: INTEGER"), std::string::npos) << output;
  EXPECT_NE(output.find("SIZE INTEGER: digits=2 scale=0 length=2"), std::string::npos) << output;
}

TEST_F(DebugTest, GuesserReportsWidening) {
  ASSERT_NE(output_file_, nullptr);
  Guesser guesser(verbose_settings());
  guesser.adjust_to_compensate_for_values(std::vector<std::string>{"12", "1.5"});
  std::string output = get_output();
  EXPECT_NE(output.find("TYPE: INTEGER -> DECIMAL (widened within group)"), std::string::npos)
      << output;
}

TEST_F(DebugTest, GuesserReportsFallback) {
  ASSERT_NE(output_file_, nullptr);
  Guesser guesser(verbose_settings());
  guesser.adjust_to_compensate_for_values(std::vector<std::string>{"true", "7"});
  std::string output = get_output();
  EXPECT_NE(output.find("TYPE: BOOLEAN -> STRING"), std::string::npos) << output;
}

TEST_F(DebugTest, QuietGuesserWritesNothing) {
  ASSERT_NE(output_file_, nullptr);
  GuessSettings settings;
  settings.debug.output = output_file_;
  Guesser guesser(settings);
  guesser.adjust_to_compensate_for_values(std::vector<std::string>{"true", "7"});
  EXPECT_TRUE(get_output().empty());
}
