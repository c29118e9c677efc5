#include "cli/Cli.hpp"

#include "LoopbackServer.hpp"
#include "common/Logger.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using wapi::common::LogTarget;
using wapi::common::Logger;
using wapi::test::LoopbackServer;

namespace {

void clearCliEnv() {
  const char* vVars[] = {"WAPI_ENDPOINT", "WAPI_USERNAME",  "WAPI_PASSWORD",
                         "WAPI_TLS_VERIFY", "WAPI_LOG_LEVEL", "WAPI_DEBUG", nullptr};
  for (int i = 0; vVars[i] != nullptr; ++i) {
    unsetenv(vVars[i]);
  }
}

}  // namespace

class CliTest : public ::testing::Test {
 protected:
  void SetUp() override {
    clearCliEnv();
    _sSavedLevel = spdlog::level::to_string_view(Logger::get()->level()).data();
  }

  void TearDown() override {
    clearCliEnv();
    Logger::init(_sSavedLevel, LogTarget::Stdout);
  }

  void pointAt(const LoopbackServer& lsServer) {
    setenv("WAPI_ENDPOINT", ("http://127.0.0.1:" + std::to_string(lsServer.port())).c_str(), 1);
    setenv("WAPI_USERNAME", "admin", 1);
    setenv("WAPI_PASSWORD", "infoblox", 1);
    setenv("WAPI_TLS_VERIFY", "false", 1);
  }

  std::string _sSavedLevel;
};

TEST_F(CliTest, StdoutIsJsonWhileLoggingAtInfo) {
  LoopbackServer lsServer;
  lsServer.replyWith(200, "OK",
                     R"({"result":[{"_ref":"record:a/r1:h.example.com/default",)"
                     R"("name":"h.example.com","ipv4addr":"10.0.0.5","view":"default"}]})");
  pointAt(lsServer);
  setenv("WAPI_LOG_LEVEL", "info", 1);

  std::ostringstream ossErr;
  ::testing::internal::CaptureStdout();
  ::testing::internal::CaptureStderr();
  const int iExit = wapi::cli::run({"a", "h.example.com"}, std::cout, ossErr);
  std::cout.flush();
  Logger::get()->flush();
  const std::string sOut = ::testing::internal::GetCapturedStdout();
  const std::string sLog = ::testing::internal::GetCapturedStderr();

  ASSERT_EQ(iExit, 0) << ossErr.str();
  const auto jOut = nlohmann::json::parse(sOut, nullptr, /*allow_exceptions=*/false);
  ASSERT_TRUE(jOut.is_array()) << sOut;
  ASSERT_EQ(jOut.size(), 1u);
  EXPECT_EQ(jOut[0]["_ref"], "record:a/r1:h.example.com/default");
  EXPECT_NE(sLog.find("Initializing Config{"), std::string::npos);
}

TEST_F(CliTest, NonNumericPageSizeIsUsageError) {
  std::ostringstream ossOut;
  std::ostringstream ossErr;
  EXPECT_EQ(wapi::cli::run({"delegated-zones", "abc"}, ossOut, ossErr), wapi::cli::kExitUsage);
  EXPECT_EQ(wapi::cli::run({"delegated-zones", "10x"}, ossOut, ossErr), wapi::cli::kExitUsage);
  EXPECT_TRUE(ossOut.str().empty());
  EXPECT_NE(ossErr.str().find("page size is not a number: abc"), std::string::npos);
}

TEST_F(CliTest, NonPositivePageSizeIsValidationFailure) {
  LoopbackServer lsServer;
  pointAt(lsServer);
  setenv("WAPI_LOG_LEVEL", "off", 1);

  std::ostringstream ossOut;
  std::ostringstream ossErr;
  EXPECT_EQ(wapi::cli::run({"delegated-zones", "0"}, ossOut, ossErr), EXIT_FAILURE);
  EXPECT_EQ(wapi::cli::run({"delegated-zones", "-5"}, ossOut, ossErr), EXIT_FAILURE);
  EXPECT_NE(ossErr.str().find("[error]"), std::string::npos);
  EXPECT_TRUE(lsServer.requests().empty());
}

TEST_F(CliTest, UnknownCommandIsUsageError) {
  std::ostringstream ossOut;
  std::ostringstream ossErr;
  EXPECT_EQ(wapi::cli::run({"srv", "x"}, ossOut, ossErr), wapi::cli::kExitUsage);
  EXPECT_EQ(wapi::cli::run({}, ossOut, ossErr), wapi::cli::kExitUsage);
  EXPECT_EQ(wapi::cli::run({"a"}, ossOut, ossErr), wapi::cli::kExitUsage);
  EXPECT_NE(ossErr.str().find("usage: wapi-cli"), std::string::npos);
}
