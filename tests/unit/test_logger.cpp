#include "common/Logger.hpp"

#include "common/Errors.hpp"

#include <gtest/gtest.h>

#include <spdlog/sinks/null_sink.h>

#include <string>

using namespace wapi::common;

TEST(LoggerTest, InitUpdatesLevelOfProcessLogger) {
  Logger::init("warn");
  EXPECT_EQ(Logger::get()->level(), spdlog::level::warn);
  EXPECT_EQ(Logger::get()->name(), "wapi");
  Logger::init("off");
  EXPECT_EQ(Logger::get()->level(), spdlog::level::off);
}

TEST(LoggerTest, UnknownLevelIsRejected) {
  EXPECT_THROW(Logger::init("verbose"), ConfigurationError);
  EXPECT_NO_THROW(Logger::init("off"));
}

TEST(LoggerTest, ResolvePrefersInjectedSink) {
  auto spLog = std::make_shared<spdlog::logger>("injected",
                                                std::make_shared<spdlog::sinks::null_sink_mt>());
  EXPECT_EQ(Logger::resolve(spLog), spLog);
  EXPECT_EQ(Logger::resolve(nullptr), Logger::get());
}

TEST(LoggerTest, StderrTargetKeepsStdoutClean) {
  Logger::init("info", LogTarget::Stderr);
  ::testing::internal::CaptureStdout();
  ::testing::internal::CaptureStderr();
  Logger::get()->info("routed to stderr");
  Logger::get()->flush();
  const std::string sOut = ::testing::internal::GetCapturedStdout();
  const std::string sErr = ::testing::internal::GetCapturedStderr();
  Logger::init("off", LogTarget::Stdout);

  EXPECT_TRUE(sOut.empty()) << sOut;
  EXPECT_NE(sErr.find("routed to stderr"), std::string::npos);
  EXPECT_EQ(Logger::get()->name(), "wapi");
}
