// test_log.cpp
// Tests for level parsing, threshold filtering and sink routing.

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include <hookwatch/log.hpp>

using hookwatch::log::Level;

namespace {

std::vector<std::string> g_lines;
std::vector<Level> g_levels;

void captureSink(Level level, const char *line) {
  g_levels.push_back(level);
  g_lines.emplace_back(line);
}

class LogTest : public ::testing::Test {
protected:
  void SetUp() override {
    g_lines.clear();
    g_levels.clear();
    m_savedLevel = hookwatch::log::getLevel();
    m_savedSink = hookwatch::log::setSink(&captureSink);
  }
  void TearDown() override {
    hookwatch::log::setSink(m_savedSink);
    hookwatch::log::setLevel(m_savedLevel);
  }

private:
  Level m_savedLevel{Level::Info};
  hookwatch::log::Sink m_savedSink{nullptr};
};

} // namespace

TEST(LogLevelTest, ParsesNamesAndShortForms) {
  using hookwatch::log::parseLevel;
  EXPECT_EQ(parseLevel("debug", Level::Error), Level::Debug);
  EXPECT_EQ(parseLevel("DEBUG", Level::Error), Level::Debug);
  EXPECT_EQ(parseLevel("i", Level::Error), Level::Info);
  EXPECT_EQ(parseLevel("Warning", Level::Error), Level::Warn);
  EXPECT_EQ(parseLevel("3", Level::Debug), Level::Error);
}

TEST(LogLevelTest, UnknownTextFallsBack) {
  using hookwatch::log::parseLevel;
  EXPECT_EQ(parseLevel(nullptr, Level::Warn), Level::Warn);
  EXPECT_EQ(parseLevel("", Level::Warn), Level::Warn);
  EXPECT_EQ(parseLevel("verbose", Level::Info), Level::Info);
  EXPECT_EQ(parseLevel("debugdebugdebugdebug", Level::Info), Level::Info);
}

TEST_F(LogTest, MessagesBelowThresholdAreDropped) {
  hookwatch::log::setLevel(Level::Warn);
  HOOKWATCH_LOG_DEBUG("debug %d", 1);
  HOOKWATCH_LOG_INFO("info %d", 2);
  HOOKWATCH_LOG_WARN("warn %d", 3);
  HOOKWATCH_LOG_ERROR("error %d", 4);

  ASSERT_EQ(g_lines.size(), 2u);
  EXPECT_EQ(g_levels[0], Level::Warn);
  EXPECT_EQ(g_levels[1], Level::Error);
  EXPECT_NE(g_lines[0].find("warn 3"), std::string::npos);
  EXPECT_NE(g_lines[1].find("error 4"), std::string::npos);
}

TEST_F(LogTest, LineCarriesLevelAndShortenedSourcePath) {
  hookwatch::log::setLevel(Level::Debug);
  hookwatch::log::log(Level::Info, "/home/dev/hookwatch/src/hook/raw_hook.cpp",
                      42, "released %s", "keyboard");

  ASSERT_EQ(g_lines.size(), 1u);
  const std::string &line = g_lines[0];
  EXPECT_EQ(line.rfind("[hookwatch] ", 0), 0u);
  EXPECT_NE(line.find("[INFO]"), std::string::npos);
  EXPECT_NE(line.find(" src/hook/raw_hook.cpp:42: released keyboard"),
            std::string::npos);
  EXPECT_EQ(line.find("/home/dev"), std::string::npos);
}

TEST_F(LogTest, PathWithoutSourceDirectoryKeepsBasename) {
  hookwatch::log::setLevel(Level::Debug);
  hookwatch::log::log(Level::Error, "C:\\work\\app\\main.cpp", 7, "boom");
  ASSERT_EQ(g_lines.size(), 1u);
  EXPECT_NE(g_lines[0].find(" main.cpp:7: boom"), std::string::npos);
}
