#include "common/Errors.hpp"

#include <gtest/gtest.h>

using namespace wapi::common;

TEST(ErrorsTest, AppErrorCarriesStatusAndCode) {
  AppError err(500, "internal_error", "Something went wrong");
  EXPECT_EQ(err._iHttpStatus, 500);
  EXPECT_EQ(err._sErrorCode, "internal_error");
  EXPECT_STREQ(err.what(), "Something went wrong");
}

TEST(ErrorsTest, ValidationErrorIs400) {
  ValidationError err("invalid_ipv4", "Invalid IPv4 address: '300.1.1.1'");
  EXPECT_EQ(err._iHttpStatus, 400);
  EXPECT_EQ(err._sErrorCode, "invalid_ipv4");
}

TEST(ErrorsTest, ConfigurationErrorHasNoStatus) {
  ConfigurationError err("missing_trust_store", "Truststore path is empty.");
  EXPECT_EQ(err._iHttpStatus, 0);
  EXPECT_EQ(err._sErrorCode, "missing_trust_store");
}

TEST(ErrorsTest, SecurityInitErrorHasNoStatus) {
  SecurityInitError err("trust_store_not_found", "Can't find the trustStore: /x.p12");
  EXPECT_EQ(err._iHttpStatus, 0);
  EXPECT_EQ(err._sErrorCode, "trust_store_not_found");
}

TEST(ErrorsTest, ApiErrorCarriesWapiFields) {
  ApiError err(400, "Client.Ibap.Data.Conflict",
               "AdmConDataError: None (IBDataConflictError: IB.Data.Conflict:The record "
               "already exists.)",
               "The record already exists.");
  EXPECT_EQ(err._iHttpStatus, 400);
  EXPECT_EQ(err._sErrorCode, "Client.Ibap.Data.Conflict");
  EXPECT_EQ(err._sText, "The record already exists.");
}

TEST(ErrorsTest, TransportErrorKeepsResponseStatus) {
  TransportError err(502, "http_error", "Request failed, 502 Bad Gateway");
  EXPECT_EQ(err._iHttpStatus, 502);
  EXPECT_EQ(err._sErrorCode, "http_error");
}

TEST(ErrorsTest, PolymorphicCatchAsAppError) {
  // All derived types should be catchable as AppError&
  try {
    throw ValidationError("test", "test message");
  } catch (const AppError& err) {
    EXPECT_EQ(err._iHttpStatus, 400);
    EXPECT_EQ(err._sErrorCode, "test");
    EXPECT_STREQ(err.what(), "test message");
  }

  try {
    throw ApiError(404, "Client.Ibap.Data.NotFound", "not found", "");
  } catch (const AppError& err) {
    EXPECT_EQ(err._iHttpStatus, 404);
  }

  try {
    throw TransportError(0, "timeout", "timed out");
  } catch (const AppError& err) {
    EXPECT_EQ(err._iHttpStatus, 0);
  }
}

TEST(ErrorsTest, CatchableAsStdRuntimeError) {
  try {
    throw SecurityInitError("trust_store_invalid", "bad password");
  } catch (const std::runtime_error& err) {
    EXPECT_STREQ(err.what(), "bad password");
  }
}
