#include "security/TrustStore.hpp"

#include "TestPkcs12.hpp"
#include "common/Errors.hpp"

#include <gtest/gtest.h>

#include <openssl/ssl.h>

#include <cstdio>
#include <fstream>
#include <memory>
#include <string>
#include <sys/stat.h>

using wapi::common::SecurityInitError;
using wapi::security::TrustStore;

class TrustStoreTest : public ::testing::Test {
 protected:
  static void SetUpTestSuite() {
    mkdir(kResourceDir, 0700);
    wapi::test::TestCertificate tc("wapi-test-ca");
    tc.writePkcs12(kCertsOnlyPath, "changeit", true);
    tc.writePkcs12(kWithKeyPath, "changeit", false);
    tc.writePkcs12(std::string(kResourceDir) + "/bundled.p12", "changeit", true);
  }

  static void TearDownTestSuite() {
    std::remove(kCertsOnlyPath);
    std::remove(kWithKeyPath);
    std::remove((std::string(kResourceDir) + "/bundled.p12").c_str());
    rmdir(kResourceDir);
  }

  static constexpr const char* kResourceDir = "/tmp/wapi_test_resources";
  static constexpr const char* kCertsOnlyPath = "/tmp/wapi_test_truststore.p12";
  static constexpr const char* kWithKeyPath = "/tmp/wapi_test_keystore.p12";
};

TEST_F(TrustStoreTest, LoadsCertificateOnlyStore) {
  TrustStore ts(kCertsOnlyPath, "changeit", kResourceDir);
  EXPECT_EQ(ts.size(), 1u);
  EXPECT_EQ(ts.path(), kCertsOnlyPath);
}

TEST_F(TrustStoreTest, KeepsCertificateAndDropsKey) {
  TrustStore ts(kWithKeyPath, "changeit", kResourceDir);
  EXPECT_EQ(ts.size(), 1u);
}

TEST_F(TrustStoreTest, ResolvesClasspathAgainstResourceDir) {
  EXPECT_EQ(TrustStore::resolvePath("classpath:/infoblox.p12", "/usr/share/wapi-client"),
            "/usr/share/wapi-client/infoblox.p12");
  EXPECT_EQ(TrustStore::resolvePath("classpath:certs/a.p12", "/opt/res/"), "/opt/res/certs/a.p12");
  EXPECT_EQ(TrustStore::resolvePath("/etc/ssl/infoblox.p12", "/opt/res"), "/etc/ssl/infoblox.p12");

  TrustStore ts("classpath:/bundled.p12", "changeit", kResourceDir);
  EXPECT_EQ(ts.path(), std::string(kResourceDir) + "/bundled.p12");
  EXPECT_EQ(ts.size(), 1u);
}

TEST_F(TrustStoreTest, MissingFileThrows) {
  try {
    TrustStore ts("/tmp/wapi_test_does_not_exist.p12", "changeit", kResourceDir);
    FAIL() << "expected SecurityInitError";
  } catch (const SecurityInitError& ex) {
    EXPECT_EQ(ex._sErrorCode, "trust_store_not_found");
  }
}

TEST_F(TrustStoreTest, WrongPasswordThrows) {
  try {
    TrustStore ts(kCertsOnlyPath, "wrong-password", kResourceDir);
    FAIL() << "expected SecurityInitError";
  } catch (const SecurityInitError& ex) {
    EXPECT_EQ(ex._sErrorCode, "trust_store_invalid");
  }
}

TEST_F(TrustStoreTest, GarbageFileThrows) {
  const std::string sPath = "/tmp/wapi_test_garbage.p12";
  {
    std::ofstream ofs(sPath, std::ios::binary);
    ofs << "this is not a PKCS#12 file";
  }
  EXPECT_THROW(TrustStore(sPath, "changeit", kResourceDir), SecurityInitError);
  std::remove(sPath.c_str());
}

TEST_F(TrustStoreTest, InstallsIntoSslContextTwice) {
  TrustStore ts(kCertsOnlyPath, "changeit", kResourceDir);
  std::unique_ptr<SSL_CTX, decltype(&SSL_CTX_free)> upCtx(SSL_CTX_new(TLS_client_method()),
                                                          &SSL_CTX_free);
  ASSERT_TRUE(upCtx);
  EXPECT_NO_THROW(ts.installTo(upCtx.get()));
  // The same certificate added again is not an error.
  EXPECT_NO_THROW(ts.installTo(upCtx.get()));
  EXPECT_GE(sk_X509_OBJECT_num(X509_STORE_get0_objects(SSL_CTX_get_cert_store(upCtx.get()))), 1);
}
