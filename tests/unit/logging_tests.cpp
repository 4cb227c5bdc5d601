#include "weathermcp/utils/logging.hpp"
#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace weathermcp::logging;

class LoggingTest : public ::testing::Test {
protected:
  struct Entry {
    Level level;
    std::string message;
    std::string file;
    int line;
  };

  void SetUp() override {
    previous_level_ = getLevel();
    setHandler([this](Level level, const std::string &message,
                      const std::string &file, int line) {
      entries_.push_back({level, message, file, line});
    });
  }

  void TearDown() override {
    setHandler(nullptr);
    setLevel(previous_level_);
  }

  Level previous_level_ = Level::Info;
  std::vector<Entry> entries_;
};

TEST_F(LoggingTest, LevelNames) {
  EXPECT_EQ(levelToString(Level::Trace), "TRACE");
  EXPECT_EQ(levelToString(Level::Warning), "WARNING");
  EXPECT_EQ(levelToString(Level::Fatal), "FATAL");
}

TEST_F(LoggingTest, LevelFromStringIgnoresCase) {
  EXPECT_EQ(levelFromString("debug"), Level::Debug);
  EXPECT_EQ(levelFromString("INFO"), Level::Info);
  EXPECT_EQ(levelFromString("Warn"), Level::Warning);
  EXPECT_EQ(levelFromString("error"), Level::Error);
  EXPECT_THROW(levelFromString("loud"), std::invalid_argument);
}

TEST_F(LoggingTest, MessagesBelowLevelAreDropped) {
  setLevel(Level::Warning);

  WEATHERMCP_LOG_INFO("hidden");
  WEATHERMCP_LOG_WARNING("shown " << 1);
  WEATHERMCP_LOG_ERROR("also shown");

  ASSERT_EQ(entries_.size(), 2u);
  EXPECT_EQ(entries_[0].level, Level::Warning);
  EXPECT_EQ(entries_[0].message, "shown 1");
  EXPECT_EQ(entries_[1].level, Level::Error);
}

TEST_F(LoggingTest, DisabledMessageIsNotFormatted) {
  setLevel(Level::Error);

  int evaluations = 0;
  auto count = [&evaluations] {
    ++evaluations;
    return "x";
  };
  WEATHERMCP_LOG_DEBUG(count());

  EXPECT_EQ(evaluations, 0);
  EXPECT_TRUE(entries_.empty());
}

TEST_F(LoggingTest, MacrosRecordSourceLocation) {
  setLevel(Level::Trace);

  WEATHERMCP_LOG_TRACE("here");

  ASSERT_EQ(entries_.size(), 1u);
  EXPECT_NE(entries_[0].file.find("logging_tests.cpp"), std::string::npos);
  EXPECT_GT(entries_[0].line, 0);
}

TEST_F(LoggingTest, IsEnabledFollowsLevel) {
  setLevel(Level::Info);
  EXPECT_FALSE(isEnabled(Level::Debug));
  EXPECT_TRUE(isEnabled(Level::Info));
  EXPECT_TRUE(isEnabled(Level::Fatal));
}
